#include "bountygate/policy/RuleManifest.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "bountygate/infra/Config.hpp"

namespace bountygate {

namespace {

std::regex compile_rule(const std::string& id, const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw ConfigError("rule '" + id + "' has an invalid pattern: " + e.what());
    }
}

std::string required_string(const nlohmann::json& entry, const char* key, const char* section) {
    if (!entry.contains(key) || !entry.at(key).is_string() ||
        entry.at(key).get<std::string>().empty()) {
        throw ConfigError(std::string("rule manifest: every '") + section +
                          "' entry needs a non-empty string '" + key + "'");
    }
    return entry.at(key).get<std::string>();
}

template <typename Rule>
const Rule* first_of(const std::vector<ManifestRule>& rules, const std::string& text) {
    for (const auto& r : rules) {
        const Rule* rule = std::get_if<Rule>(&r);
        if (rule && std::regex_search(text, rule->compiled)) return rule;
    }
    return nullptr;
}

template <typename Rule>
size_t count_of(const std::vector<ManifestRule>& rules) {
    size_t n = 0;
    for (const auto& r : rules) {
        if (std::holds_alternative<Rule>(r)) ++n;
    }
    return n;
}

} // namespace

void RuleManifest::add_block(const std::string& id, const std::string& pattern,
                             const std::string& notes) {
    rules_.emplace_back(BlockRule{id, pattern, notes, compile_rule(id, pattern)});
}

void RuleManifest::add_validation(const std::string& id, const std::string& pattern,
                                  const std::string& notes) {
    rules_.emplace_back(ValidationRule{id, pattern, notes, compile_rule(id, pattern)});
}

RuleManifest RuleManifest::defaults() {
    RuleManifest m;
    m.add_block("rce-templates", "(rce|remote[-_]?exec|command[-_]?injection)",
                "Remote code execution - high risk");
    m.add_block("sql-exploit", "(sqlmap|sql[-_]?injection[-_]?exploit)",
                "SQL exploitation tools - requires manual approval");
    m.add_block("file-upload-exec", "(upload[-_]?exec|webshell)",
                "File upload exploitation - destructive");
    m.add_block("dos-attacks", "(dos|denial[-_]?of[-_]?service|slowloris)",
                "Denial of service - always blocked");

    m.add_validation("auth-bypass", "(auth[-_]?bypass|authentication)",
                     "Authentication testing - validate scope");
    m.add_validation("file-inclusion", "(lfi|rfi|file[-_]?inclusion)",
                     "File inclusion - validate if read-only");
    return m;
}

RuleManifest RuleManifest::from_json_text(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("rule manifest is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("rule manifest must be a JSON object");
    }

    RuleManifest m;
    std::set<std::string> seen;

    auto load_section = [&](const char* section, bool blocking) {
        if (!j.contains(section)) return;
        const auto& arr = j.at(section);
        if (!arr.is_array()) {
            throw ConfigError(std::string("rule manifest: '") + section + "' must be an array");
        }
        for (const auto& entry : arr) {
            if (!entry.is_object()) {
                throw ConfigError(std::string("rule manifest: '") + section +
                                  "' entries must be objects");
            }
            const std::string id = required_string(entry, "id", section);
            const std::string pattern = required_string(entry, "pattern", section);
            const std::string notes = entry.value("notes", std::string());

            if (!seen.insert(id).second) {
                throw ConfigError("rule manifest: duplicate rule id '" + id + "'");
            }
            if (blocking) {
                m.add_block(id, pattern, notes);
            } else {
                m.add_validation(id, pattern, notes);
            }
        }
    };

    load_section("blocked_patterns", true);
    load_section("requires_validation", false);

    if (m.rules_.empty()) {
        throw ConfigError("rule manifest declares no rules");
    }
    return m;
}

RuleManifest RuleManifest::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open rule manifest: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return from_json_text(ss.str());
}

const BlockRule* RuleManifest::first_block(const std::string& template_id) const {
    return first_of<BlockRule>(rules_, template_id);
}

const ValidationRule* RuleManifest::first_validation(const std::string& template_id) const {
    return first_of<ValidationRule>(rules_, template_id);
}

size_t RuleManifest::block_count() const {
    return count_of<BlockRule>(rules_);
}

size_t RuleManifest::validation_count() const {
    return count_of<ValidationRule>(rules_);
}

} // namespace bountygate
