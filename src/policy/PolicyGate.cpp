#include "bountygate/policy/PolicyGate.hpp"

#include "bountygate/advisory/AdvisoryService.hpp"
#include "bountygate/infra/Logger.hpp"
#include "bountygate/policy/AuditTrail.hpp"
#include "bountygate/policy/OverrideChannel.hpp"
#include "bountygate/policy/RuleManifest.hpp"
#include "bountygate/policy/ScopeMatcher.hpp"

namespace bountygate {

namespace {

PolicyDecision make(Decision d, double confidence, std::string reason, std::string details) {
    PolicyDecision out;
    out.decision = d;
    out.confidence = confidence;
    out.reason = std::move(reason);
    out.details = std::move(details);
    return out;
}

} // namespace

PolicyGate::PolicyGate(const RuleManifest& manifest, AuditTrail& audit, Logger& log,
                       AdvisoryService* advisory)
    : manifest_(manifest),
      audit_(audit),
      log_(log),
      advisory_(advisory) {}

PolicyDecision PolicyGate::record(const std::string& target, const std::string& kind,
                                  const PolicyDecision& decision) {
    audit_.append(target, kind, decision);
    return decision;
}

// ---------------------------------------------------------------------------
// Scope: out_of_scope > in_scope > advisory > UNKNOWN
// ---------------------------------------------------------------------------
PolicyDecision PolicyGate::validate_scope(const std::string& target,
                                          const std::optional<ScopeDefinition>& scope) {
    log_.info("POLICY", "validating scope for " + target);

    if (!scope) {
        return record(target, "scope_check",
            make(Decision::Unknown, 0.0, "no scope provided",
                 "Provide --scope-file with the program's in-scope targets"));
    }

    if (const std::string* p = first_match(target, scope->out_of_scope)) {
        return record(target, "scope_check",
            make(Decision::Blocked, 1.0, "Target matches out-of-scope pattern: " + *p,
                 "Explicitly excluded from testing"));
    }

    if (const std::string* p = first_match(target, scope->in_scope)) {
        return record(target, "scope_check",
            make(Decision::Allowed, 1.0, "Target matches in-scope pattern: " + *p,
                 "Authorised for testing"));
    }

    if (advisory_) {
        log_.info("POLICY", "no local scope rule for " + target + ", escalating to advisory");
        return record(target, "scope_check_advisory", advisory_->validate_scope(target, *scope));
    }

    return record(target, "scope_check",
        make(Decision::Unknown, 0.0, "Target does not match any scope patterns",
             "Add target to scope file or enable advisory validation"));
}

// ---------------------------------------------------------------------------
// Action: block rules > validation rules (advisory when configured) > ALLOWED
// ---------------------------------------------------------------------------
PolicyDecision PolicyGate::validate_action(const ActionDescriptor& action) {
    const std::string kind = "scanner_" + action.scanner_kind;
    const std::string& tpl = action.template_or_rule_id;

    if (const BlockRule* rule = manifest_.first_block(tpl)) {
        return record(action.target, kind,
            make(Decision::Blocked, 1.0, "Template matches blocked pattern: " + rule->id, rule->notes));
    }

    if (const ValidationRule* rule = manifest_.first_validation(tpl)) {
        if (advisory_) {
            return record(action.target, kind + "_advisory", advisory_->validate_action(action));
        }
        return record(action.target, kind,
            make(Decision::RequiresValidation, 0.5, "Template requires validation: " + rule->id,
                 rule->notes));
    }

    return record(action.target, kind,
        make(Decision::Allowed, 1.0, "No policy restrictions matched",
             "Action is within safe parameters"));
}

bool PolicyGate::confirm_override(const std::string& target, OverrideChannel& channel) {
    log_.warn("POLICY", "scope for " + target + " is UNKNOWN; manual override requested");

    const auto reply = channel.ask(
        "Scope for '" + target + "' could not be verified.\n"
        "Type " + std::string(kOverrideToken) + " to proceed at your own risk: ");

    if (reply && *reply == kOverrideToken) {
        record(target, "manual_override",
               make(Decision::Allowed, 1.0, "manual override accepted", "Operator accepted risk"));
        return true;
    }

    record(target, "manual_override",
           make(Decision::Blocked, 1.0, "manual override declined",
                reply ? "Confirmation token mismatch" : "No operator input"));
    return false;
}

bool PolicyGate::confirm_validation(const ActionDescriptor& action, OverrideChannel& channel) {
    const std::string& tpl = action.template_or_rule_id;
    log_.warn("POLICY", "template " + tpl + " on " + action.target + " needs validation; asking operator");

    const auto reply = channel.ask(
        "Template '" + tpl + "' on '" + action.target + "' requires validation.\n"
        "Type " + std::string(kOverrideToken) + " to run it for this scan: ");

    if (reply && *reply == kOverrideToken) {
        record(action.target, "validation_override",
               make(Decision::Allowed, 1.0, "validation confirmed by operator", "Template: " + tpl));
        return true;
    }

    record(action.target, "validation_override",
           make(Decision::Blocked, 1.0, "validation declined",
                reply ? "Confirmation token mismatch" : "No operator input"));
    return false;
}

} // namespace bountygate
