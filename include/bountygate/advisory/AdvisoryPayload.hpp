#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bountygate/core/Types.hpp"

namespace bountygate {

// Removes a surrounding ```json ... ``` (or bare ``` ... ```) fence.
// Text without a fence comes back trimmed.
std::string unwrap_fenced(const std::string& text);

// Policy payload:
//   {"decision": "ALLOWED"|"BLOCKED"|"UNKNOWN", "confidence": 0..1,
//    "reasons": [..], "suggested_next_steps": [..] | "risk_level": ".."}
struct PolicyAdvice {
    Decision decision = Decision::Unknown;
    double confidence = 0.0;
    std::vector<std::string> reasons;
    std::string details;
};

// Triage payload:
//   {"score": 0..1, "confidence": 0..1, "explanation": "..",
//    "severity": "..", "is_likely_fp": bool}
struct FindingAdvice {
    double score = 0.5;
    double confidence = 0.5;
    std::string explanation;
    std::string severity;
    bool is_likely_fp = false;
};

// Strict parsers. On rejection they return nullopt and describe the
// problem in `*error` when it is non-null.
std::optional<PolicyAdvice> parse_policy_advice(const std::string& text, std::string* error);
std::optional<FindingAdvice> parse_finding_advice(const std::string& text, std::string* error);

} // namespace bountygate
