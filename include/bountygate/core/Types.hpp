#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bountygate {

// ---------------------------------------------------------------------------
// Policy decision values. The persisted spelling (ALLOWED, BLOCKED, ...) is
// part of the audit contract read by external tooling. Do not rename.
// ---------------------------------------------------------------------------
enum class Decision : uint8_t {
    Allowed,
    Blocked,
    Unknown,
    RequiresValidation
};

const char* to_string(Decision d);
std::optional<Decision> decision_from_string(const std::string& s);

struct PolicyDecision {
    Decision decision = Decision::Unknown;
    double confidence = 0.0;
    std::string reason;
    std::string details;
};

struct ActionDescriptor {
    std::string scanner_kind;
    std::string target;
    std::string template_or_rule_id;
    std::string severity_hint;
};

// Produced by scan adapters. Triage fields are written by TriageScorer only.
struct FindingRecord {
    std::string target;
    std::string name;
    std::string severity;
    std::string description;
    nlohmann::json evidence = nlohmann::json::object();
    std::string scanner_kind;
    std::string matched_at;

    double ml_score = 0.0;
    double llm_score = 0.0;
    double final_score = 0.0;
    double confidence = 0.0;
    std::string severity_adjusted;
    bool is_false_positive = false;
    std::string explanation;
};

nlohmann::json to_json(const FindingRecord& f);

// Throws std::invalid_argument when a required field is missing or has the
// wrong type. Triage fields are optional.
FindingRecord finding_from_json(const nlohmann::json& j);

enum class RunStatus : uint8_t {
    Running,
    Completed,
    Failed
};

const char* to_string(RunStatus s);

enum class ScanMode : uint8_t {
    PassiveOnly,
    SafeScan,
    FullScanWithValidation
};

const char* to_string(ScanMode m);
std::optional<ScanMode> scan_mode_from_string(const std::string& s);

struct RunRecord {
    std::string run_id;
    std::string target;
    ScanMode mode = ScanMode::SafeScan;
    std::string output_location;
    RunStatus status = RunStatus::Running;
    int64_t start_time_ms = 0;
    int64_t end_time_ms = 0;
    uint32_t findings_count = 0;
};

struct AuditRecord {
    std::string target;
    std::string action_kind;
    Decision decision = Decision::Unknown;
    std::string reason;
    double confidence = 0.0;
    int64_t timestamp_ms = 0;
    std::string digest;
};

int64_t wall_clock_ms();

} // namespace bountygate
