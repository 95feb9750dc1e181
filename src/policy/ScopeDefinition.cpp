#include "bountygate/policy/ScopeDefinition.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "bountygate/infra/Config.hpp"

namespace bountygate {

namespace {

std::vector<std::string> read_patterns(const nlohmann::json& j, const char* key,
                                       const std::string& path) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const auto& arr = j.at(key);
    if (!arr.is_array()) {
        throw ConfigError("scope file " + path + ": '" + key + "' must be an array");
    }
    for (const auto& v : arr) {
        if (!v.is_string() || v.get<std::string>().empty()) {
            throw ConfigError("scope file " + path + ": '" + key +
                              "' entries must be non-empty strings");
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

} // namespace

ScopeDefinition ScopeDefinition::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open scope file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("scope file " + path + " is not valid JSON: " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("scope file " + path + " must contain a JSON object");
    }

    ScopeDefinition scope;
    scope.in_scope = read_patterns(j, "in_scope", path);
    scope.out_of_scope = read_patterns(j, "out_of_scope", path);
    return scope;
}

} // namespace bountygate
