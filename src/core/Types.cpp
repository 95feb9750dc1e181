#include "bountygate/core/Types.hpp"

#include <chrono>
#include <stdexcept>

namespace bountygate {

const char* to_string(Decision d) {
    switch (d) {
        case Decision::Allowed:            return "ALLOWED";
        case Decision::Blocked:            return "BLOCKED";
        case Decision::Unknown:            return "UNKNOWN";
        case Decision::RequiresValidation: return "REQUIRES_VALIDATION";
    }
    return "UNKNOWN";
}

std::optional<Decision> decision_from_string(const std::string& s) {
    if (s == "ALLOWED") return Decision::Allowed;
    if (s == "BLOCKED") return Decision::Blocked;
    if (s == "UNKNOWN") return Decision::Unknown;
    if (s == "REQUIRES_VALIDATION") return Decision::RequiresValidation;
    return std::nullopt;
}

const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
    }
    return "failed";
}

const char* to_string(ScanMode m) {
    switch (m) {
        case ScanMode::PassiveOnly:            return "passive-only";
        case ScanMode::SafeScan:               return "safe-scan";
        case ScanMode::FullScanWithValidation: return "full-scan-with-validation";
    }
    return "safe-scan";
}

std::optional<ScanMode> scan_mode_from_string(const std::string& s) {
    if (s == "passive-only") return ScanMode::PassiveOnly;
    if (s == "safe-scan") return ScanMode::SafeScan;
    if (s == "full-scan-with-validation") return ScanMode::FullScanWithValidation;
    return std::nullopt;
}

nlohmann::json to_json(const FindingRecord& f) {
    return nlohmann::json{
        {"target", f.target},
        {"name", f.name},
        {"severity", f.severity},
        {"description", f.description},
        {"evidence", f.evidence},
        {"scanner_kind", f.scanner_kind},
        {"matched_at", f.matched_at},
        {"ml_score", f.ml_score},
        {"llm_score", f.llm_score},
        {"final_score", f.final_score},
        {"confidence", f.confidence},
        {"severity_adjusted", f.severity_adjusted},
        {"is_false_positive", f.is_false_positive},
        {"explanation", f.explanation}
    };
}

static std::string required_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("finding field missing or not a string: ") + key);
    }
    return it->get<std::string>();
}

static std::string optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("finding field not a string: ") + key);
    }
    return it->get<std::string>();
}

static double optional_number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0.0;
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("finding field not a number: ") + key);
    }
    return it->get<double>();
}

FindingRecord finding_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("finding is not a JSON object");
    }

    FindingRecord f;
    f.target       = required_string(j, "target");
    f.name         = required_string(j, "name");
    f.severity     = optional_string(j, "severity");
    f.description  = optional_string(j, "description");
    f.scanner_kind = optional_string(j, "scanner_kind");
    f.matched_at   = optional_string(j, "matched_at");

    auto ev = j.find("evidence");
    if (ev != j.end() && !ev->is_null()) {
        if (!ev->is_object()) {
            throw std::invalid_argument("finding evidence is not an object");
        }
        f.evidence = *ev;
    }

    f.ml_score          = optional_number(j, "ml_score");
    f.llm_score         = optional_number(j, "llm_score");
    f.final_score       = optional_number(j, "final_score");
    f.confidence        = optional_number(j, "confidence");
    f.severity_adjusted = optional_string(j, "severity_adjusted");
    f.explanation       = optional_string(j, "explanation");

    auto fp = j.find("is_false_positive");
    if (fp != j.end() && fp->is_boolean()) {
        f.is_false_positive = fp->get<bool>();
    }
    return f;
}

int64_t wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace bountygate
