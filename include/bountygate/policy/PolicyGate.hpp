#pragma once

#include <optional>
#include <string>

#include "bountygate/core/Types.hpp"
#include "bountygate/policy/ScopeDefinition.hpp"

namespace bountygate {

class AdvisoryService;
class AuditTrail;
class Logger;
class OverrideChannel;
class RuleManifest;

// ---------------------------------------------------------------------------
// PolicyGate - authorisation for targets and scanner actions.
//
// Local rules are authoritative. The advisory service is only consulted
// when no local rule settles the question, and a local BLOCKED is never
// overridden upward. Every decision, including advisory ones, is appended
// to the audit trail before it is returned.
//
// Audit action kinds:
//   scope_check, scope_check_advisory
//   scanner_<kind>, scanner_<kind>_advisory
//   manual_override, validation_override
// ---------------------------------------------------------------------------
class PolicyGate {
public:
    // `advisory` may be null (local rules only).
    PolicyGate(const RuleManifest& manifest, AuditTrail& audit, Logger& log,
               AdvisoryService* advisory);

    PolicyDecision validate_scope(const std::string& target,
                                  const std::optional<ScopeDefinition>& scope);

    PolicyDecision validate_action(const ActionDescriptor& action);

    // Asks the operator for kOverrideToken. True only on an exact match.
    // Acceptance and decline are both audited under manual_override.
    bool confirm_override(const std::string& target, OverrideChannel& channel);

    // Operator confirmation for a REQUIRES_VALIDATION action nothing else
    // resolved. Same token and audit rules as confirm_override.
    bool confirm_validation(const ActionDescriptor& action, OverrideChannel& channel);

    bool has_advisory() const { return advisory_ != nullptr; }

private:
    PolicyDecision record(const std::string& target, const std::string& kind,
                          const PolicyDecision& decision);

    const RuleManifest& manifest_;
    AuditTrail& audit_;
    Logger& log_;
    AdvisoryService* advisory_;
};

} // namespace bountygate
