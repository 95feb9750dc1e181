#pragma once

#include <string>

#include "bountygate/advisory/AdvisoryPayload.hpp"
#include "bountygate/advisory/AdvisoryTransport.hpp"
#include "bountygate/core/Types.hpp"

namespace bountygate {

class Logger;
class Storage;
struct ScopeDefinition;

// Result of scoring a finding. `ok == false` means the advisory call or its
// payload failed; `error` says why and `advice` holds neutral values.
struct FindingAdviceResult {
    bool ok = false;
    FindingAdvice advice;
    std::string error;
};

// ---------------------------------------------------------------------------
// AdvisoryService - prompt construction and strict reply handling on top of
// an AdvisoryTransport.
//
// Prompts are bounded and deterministic: targets are cut to 253 characters,
// pattern lists to 64 entries, evidence to 500 characters.
//
// Failure mapping is asymmetric:
//   validate_scope   -> UNKNOWN, confidence 0.0
//   validate_action  -> BLOCKED, confidence 0.0
//   score_finding    -> ok=false, score 0.5, confidence 0.0
// ---------------------------------------------------------------------------
class AdvisoryService {
public:
    static constexpr size_t kMaxTargetChars = 253;
    static constexpr size_t kMaxPatterns = 64;
    static constexpr size_t kMaxEvidenceChars = 500;
    static constexpr size_t kMaxStoredPromptChars = 1000;
    static constexpr size_t kMaxStoredResponseChars = 5000;

    // `storage` may be null. Exchanges are stored only when
    // `store_exchanges` is set.
    AdvisoryService(AdvisoryTransport& transport, Logger& log,
                    Storage* storage, bool store_exchanges);

    PolicyDecision validate_scope(const std::string& target, const ScopeDefinition& scope);
    PolicyDecision validate_action(const ActionDescriptor& action);
    FindingAdviceResult score_finding(const FindingRecord& finding);

    static AdvisoryRequest scope_request(const std::string& target, const ScopeDefinition& scope);
    static AdvisoryRequest action_request(const ActionDescriptor& action);
    static AdvisoryRequest finding_request(const FindingRecord& finding);

private:
    AdvisoryReply exchange(const AdvisoryRequest& request);

    AdvisoryTransport& transport_;
    Logger& log_;
    Storage* storage_;
    bool store_exchanges_;
};

} // namespace bountygate
