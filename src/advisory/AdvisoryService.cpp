#include "bountygate/advisory/AdvisoryService.hpp"

#include <algorithm>
#include <sstream>

#include <nlohmann/json.hpp>

#include "bountygate/infra/Logger.hpp"
#include "bountygate/policy/ScopeDefinition.hpp"
#include "bountygate/storage/Storage.hpp"

namespace bountygate {

namespace {

const char* kScopeSystem =
    "You are a strict security policy assistant for bug bounty programs.\n"
    "Determine whether a target is within the scope of an authorised security testing program.\n"
    "\n"
    "Respond ONLY with valid JSON in this exact format:\n"
    "{\n"
    "  \"decision\": \"ALLOWED\" or \"BLOCKED\" or \"UNKNOWN\",\n"
    "  \"confidence\": 0.0 to 1.0,\n"
    "  \"reasons\": [\"reason1\"],\n"
    "  \"suggested_next_steps\": [\"step1\"]\n"
    "}\n"
    "\n"
    "Rules:\n"
    "- ALLOWED: target clearly matches in-scope patterns\n"
    "- BLOCKED: target clearly matches out-of-scope patterns or is high-risk\n"
    "- UNKNOWN: insufficient information\n"
    "- Never suggest evasive or destructive actions\n"
    "- When in doubt, return UNKNOWN";

const char* kActionSystem =
    "You are a security policy validator for ethical bug bounty testing.\n"
    "Evaluate whether a proposed scanner action is safe and appropriate.\n"
    "\n"
    "Respond ONLY with valid JSON:\n"
    "{\n"
    "  \"decision\": \"ALLOWED\" or \"BLOCKED\",\n"
    "  \"confidence\": 0.0 to 1.0,\n"
    "  \"reasons\": [\"reason1\"],\n"
    "  \"risk_level\": \"low\" or \"medium\" or \"high\"\n"
    "}\n"
    "\n"
    "BLOCK if the action could cause damage or disruption, involves exploitation\n"
    "rather than detection, or is outside typical bug bounty scope.\n"
    "ALLOW if the action is read-only or passive standard vulnerability detection.";

const char* kFindingSystem =
    "You are a security researcher evaluating vulnerability findings.\n"
    "Score the finding from 0.0 (false positive) to 1.0 (critical true positive).\n"
    "\n"
    "Respond with JSON:\n"
    "{\n"
    "  \"score\": 0.0 to 1.0,\n"
    "  \"confidence\": 0.0 to 1.0,\n"
    "  \"explanation\": \"brief explanation\",\n"
    "  \"severity\": \"info|low|medium|high|critical\",\n"
    "  \"is_likely_fp\": true or false\n"
    "}\n"
    "\n"
    "Consider evidence quality, exploitability, impact and context.";

std::string cut(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(0, n);
}

std::string bounded_list(const std::vector<std::string>& patterns) {
    nlohmann::json arr = nlohmann::json::array();
    const size_t n = std::min(patterns.size(), AdvisoryService::kMaxPatterns);
    for (size_t i = 0; i < n; ++i) {
        arr.push_back(cut(patterns[i], AdvisoryService::kMaxTargetChars));
    }
    return arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += "; ";
        out += parts[i];
    }
    return out;
}

PolicyDecision from_advice(const PolicyAdvice& advice) {
    PolicyDecision d;
    d.decision = advice.decision;
    d.confidence = advice.confidence;
    d.reason = advice.reasons.empty() ? std::string("Advisory validation") : join(advice.reasons);
    d.details = advice.details;
    return d;
}

} // namespace

AdvisoryService::AdvisoryService(AdvisoryTransport& transport, Logger& log,
                                 Storage* storage, bool store_exchanges)
    : transport_(transport),
      log_(log),
      storage_(storage),
      store_exchanges_(store_exchanges) {}

AdvisoryRequest AdvisoryService::scope_request(const std::string& target,
                                               const ScopeDefinition& scope) {
    std::ostringstream p;
    p << "Target: " << cut(target, kMaxTargetChars) << "\n\n"
      << "In-Scope Patterns: " << bounded_list(scope.in_scope) << "\n"
      << "Out-of-Scope Patterns: " << bounded_list(scope.out_of_scope) << "\n\n"
      << "Is this target within scope for security testing?";

    AdvisoryRequest req;
    req.prompt = p.str();
    req.system_context = kScopeSystem;
    req.max_tokens = 500;
    req.temperature = 0.1;
    return req;
}

AdvisoryRequest AdvisoryService::action_request(const ActionDescriptor& action) {
    std::ostringstream p;
    p << "Scanner Action:\n"
      << "Scanner: " << cut(action.scanner_kind, 64) << "\n"
      << "Target: " << cut(action.target, kMaxTargetChars) << "\n"
      << "Template: " << (action.template_or_rule_id.empty() ? std::string("N/A")
                                                              : cut(action.template_or_rule_id, 256)) << "\n"
      << "Severity: " << (action.severity_hint.empty() ? std::string("N/A")
                                                        : cut(action.severity_hint, 64)) << "\n\n"
      << "Should this action be allowed?";

    AdvisoryRequest req;
    req.prompt = p.str();
    req.system_context = kActionSystem;
    req.max_tokens = 400;
    req.temperature = 0.1;
    return req;
}

AdvisoryRequest AdvisoryService::finding_request(const FindingRecord& finding) {
    const std::string evidence = finding.evidence.is_null()
        ? std::string("N/A")
        : finding.evidence.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::ostringstream p;
    p << "Finding:\n"
      << "Name: " << (finding.name.empty() ? std::string("Unknown") : cut(finding.name, 256)) << "\n"
      << "Severity: " << (finding.severity.empty() ? std::string("Unknown") : cut(finding.severity, 32)) << "\n"
      << "Description: " << (finding.description.empty() ? std::string("N/A")
                                                          : cut(finding.description, 1000)) << "\n"
      << "Evidence: " << cut(evidence, kMaxEvidenceChars) << "\n\n"
      << "Score this finding:";

    AdvisoryRequest req;
    req.prompt = p.str();
    req.system_context = kFindingSystem;
    req.max_tokens = 400;
    req.temperature = 0.2;
    return req;
}

AdvisoryReply AdvisoryService::exchange(const AdvisoryRequest& request) {
    AdvisoryReply reply = transport_.ask(request);

    if (reply.ok && store_exchanges_ && storage_) {
        if (!storage_->store_advisory_exchange(cut(request.prompt, kMaxStoredPromptChars),
                                               cut(reply.text, kMaxStoredResponseChars),
                                               transport_.model_name())) {
            log_.warn("ADVISORY", "failed to store advisory exchange");
        }
    }
    return reply;
}

PolicyDecision AdvisoryService::validate_scope(const std::string& target,
                                               const ScopeDefinition& scope) {
    const AdvisoryReply reply = exchange(scope_request(target, scope));

    std::string error = reply.error;
    if (reply.ok) {
        if (auto advice = parse_policy_advice(reply.text, &error)) {
            return from_advice(*advice);
        }
    }

    log_.error("ADVISORY", "scope validation failed for " + target + ": " + error);
    PolicyDecision d;
    d.decision = Decision::Unknown;
    d.confidence = 0.0;
    d.reason = "Advisory validation error: " + error;
    d.details = "Manual review required";
    return d;
}

PolicyDecision AdvisoryService::validate_action(const ActionDescriptor& action) {
    const AdvisoryReply reply = exchange(action_request(action));

    std::string error = reply.error;
    if (reply.ok) {
        if (auto advice = parse_policy_advice(reply.text, &error)) {
            return from_advice(*advice);
        }
    }

    log_.error("ADVISORY", "action validation failed for " + action.target + ": " + error);
    PolicyDecision d;
    d.decision = Decision::Blocked;
    d.confidence = 0.0;
    d.reason = "Validation error: " + error;
    d.details = "Failed to validate, blocking";
    return d;
}

FindingAdviceResult AdvisoryService::score_finding(const FindingRecord& finding) {
    FindingAdviceResult result;
    const AdvisoryReply reply = exchange(finding_request(finding));

    std::string error = reply.error;
    if (reply.ok) {
        if (auto advice = parse_finding_advice(reply.text, &error)) {
            result.ok = true;
            result.advice = *advice;
            return result;
        }
    }

    log_.warn("ADVISORY", "finding scoring failed for '" + finding.name + "': " + error);
    result.ok = false;
    result.error = error;
    result.advice.score = 0.5;
    result.advice.confidence = 0.0;
    result.advice.is_likely_fp = false;
    result.advice.explanation = "Advisory scoring unavailable: " + error;
    return result;
}

} // namespace bountygate
