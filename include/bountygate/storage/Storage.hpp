#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bountygate/core/Types.hpp"

namespace bountygate {

// ---------------------------------------------------------------------------
// Persistence collaborator. Every call reports failure as `false` (or an
// empty result); implementations log their own errors and never throw
// past this boundary.
// ---------------------------------------------------------------------------
class Storage {
public:
    virtual ~Storage() = default;

    virtual bool create_run(const RunRecord& run) = 0;
    virtual bool update_run_status(const std::string& run_id,
                                   RunStatus status,
                                   uint32_t findings_count) = 0;
    virtual std::optional<RunRecord> get_run(const std::string& run_id) = 0;

    virtual bool save_finding(const std::string& run_id, const FindingRecord& finding) = 0;
    // Ordered by final_score, highest first.
    virtual std::vector<FindingRecord> list_findings(const std::string& run_id) = 0;

    virtual bool append_policy_decision(const AuditRecord& record) = 0;
    virtual bool store_advisory_exchange(const std::string& prompt,
                                         const std::string& response,
                                         const std::string& model) = 0;
};

} // namespace bountygate
