#include "bountygate/advisory/AdvisoryPayload.hpp"

#include <cctype>

#include <nlohmann/json.hpp>

namespace bountygate {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool fail(std::string* error, const std::string& msg) {
    if (error) *error = msg;
    return false;
}

bool parse_object(const std::string& text, nlohmann::json& out, std::string* error) {
    out = nlohmann::json::parse(unwrap_fenced(text), nullptr, false);
    if (out.is_discarded()) return fail(error, "payload is not valid JSON");
    if (!out.is_object()) return fail(error, "payload is not a JSON object");
    return true;
}

// Absent -> fallback. Present -> must be a number in [0, 1].
bool read_unit(const nlohmann::json& j, const char* key, double fallback,
               double& out, std::string* error) {
    if (!j.contains(key)) {
        out = fallback;
        return true;
    }
    const auto& v = j.at(key);
    if (!v.is_number()) return fail(error, std::string("'") + key + "' is not numeric");
    out = v.get<double>();
    if (!(out >= 0.0 && out <= 1.0)) {
        return fail(error, std::string("'") + key + "' is outside [0, 1]");
    }
    return true;
}

bool read_string_list(const nlohmann::json& j, const char* key,
                      std::vector<std::string>& out, std::string* error) {
    if (!j.contains(key)) return true;
    const auto& v = j.at(key);
    if (!v.is_array()) return fail(error, std::string("'") + key + "' is not an array");
    for (const auto& item : v) {
        if (!item.is_string()) return fail(error, std::string("'") + key + "' holds a non-string");
        out.push_back(item.get<std::string>());
    }
    return true;
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

std::string unwrap_fenced(const std::string& text) {
    const auto open = text.find("```");
    if (open == std::string::npos) return trim(text);

    size_t start = open + 3;
    // Skip an info string such as "json" up to the end of the fence line.
    const auto eol = text.find('\n', start);
    if (eol != std::string::npos) {
        const std::string info = trim(text.substr(start, eol - start));
        bool is_tag = true;
        for (char c : info) {
            if (!std::isalnum(static_cast<unsigned char>(c))) { is_tag = false; break; }
        }
        if (is_tag) start = eol + 1;
    }

    const auto close = text.find("```", start);
    if (close == std::string::npos) return trim(text.substr(start));
    return trim(text.substr(start, close - start));
}

std::optional<PolicyAdvice> parse_policy_advice(const std::string& text, std::string* error) {
    nlohmann::json j;
    if (!parse_object(text, j, error)) return std::nullopt;

    if (!j.contains("decision")) {
        fail(error, "payload has no 'decision'");
        return std::nullopt;
    }
    if (!j.at("decision").is_string()) {
        fail(error, "'decision' is not a string");
        return std::nullopt;
    }

    const std::string raw = j.at("decision").get<std::string>();
    const auto decision = decision_from_string(raw);
    if (!decision || *decision == Decision::RequiresValidation) {
        fail(error, "unexpected decision '" + raw + "'");
        return std::nullopt;
    }

    PolicyAdvice advice;
    advice.decision = *decision;
    if (!read_unit(j, "confidence", 0.0, advice.confidence, error)) return std::nullopt;
    if (!read_string_list(j, "reasons", advice.reasons, error)) return std::nullopt;

    std::vector<std::string> steps;
    if (!read_string_list(j, "suggested_next_steps", steps, error)) return std::nullopt;
    if (!read_string_list(j, "next_steps", steps, error)) return std::nullopt;

    if (!steps.empty()) {
        advice.details = join(steps, "; ");
    } else if (j.contains("risk_level") && j.at("risk_level").is_string()) {
        advice.details = "Risk level: " + j.at("risk_level").get<std::string>();
    }
    return advice;
}

std::optional<FindingAdvice> parse_finding_advice(const std::string& text, std::string* error) {
    nlohmann::json j;
    if (!parse_object(text, j, error)) return std::nullopt;

    if (!j.contains("score")) {
        fail(error, "payload has no 'score'");
        return std::nullopt;
    }

    FindingAdvice advice;
    if (!read_unit(j, "score", 0.5, advice.score, error)) return std::nullopt;
    if (!read_unit(j, "confidence", 0.5, advice.confidence, error)) return std::nullopt;

    if (j.contains("is_likely_fp")) {
        if (!j.at("is_likely_fp").is_boolean()) {
            fail(error, "'is_likely_fp' is not a boolean");
            return std::nullopt;
        }
        advice.is_likely_fp = j.at("is_likely_fp").get<bool>();
    }
    if (j.contains("explanation") && j.at("explanation").is_string()) {
        advice.explanation = j.at("explanation").get<std::string>();
    }
    if (j.contains("severity") && j.at("severity").is_string()) {
        advice.severity = j.at("severity").get<std::string>();
    }
    return advice;
}

} // namespace bountygate
