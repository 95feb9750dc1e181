#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "bountygate/core/Types.hpp"

namespace bountygate {

class Logger;
class Storage;

// ---------------------------------------------------------------------------
// AuditTrail - single serialized append path for every policy decision.
//
// Each record is chained: digest = sha256(prev_digest || canonical(record)),
// starting from an empty previous digest. Records reach the logger and the
// storage collaborator in the same order they were appended.
//
// The lock covers chaining only. Persisting happens outside it: the first
// appender to find the outbox idle drains it in order, later appenders
// just enqueue. A storage failure is logged and does not stop the append.
//
// Only the most recent kRecentRecords stay in memory; tail_seed() is the
// digest preceding the oldest one kept.
// ---------------------------------------------------------------------------
class AuditTrail {
public:
    static constexpr size_t kRecentRecords = 256;

    AuditTrail(Logger& log, Storage* storage);

    AuditTrail(const AuditTrail&) = delete;
    AuditTrail& operator=(const AuditTrail&) = delete;

    // Stamps timestamp and digest, then persists. Returns the stored record.
    AuditRecord append(const std::string& target,
                       const std::string& action_kind,
                       const PolicyDecision& decision);

    // Most recent records, oldest first.
    std::vector<AuditRecord> records() const;
    std::string head_digest() const;
    std::string tail_seed() const;

    // Recomputes the chain over `records` starting from `seed`.
    static bool verify_chain(const std::vector<AuditRecord>& records,
                             const std::string& seed = std::string());
    static std::string canonical(const AuditRecord& r);

private:
    void drain();

    Logger& log_;
    Storage* storage_;

    mutable std::mutex mtx_;
    std::string head_;
    std::string seed_;
    std::deque<AuditRecord> recent_;
    std::deque<AuditRecord> outbox_;
    bool draining_{false};
};

} // namespace bountygate
