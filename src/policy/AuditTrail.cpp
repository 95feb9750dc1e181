#include "bountygate/policy/AuditTrail.hpp"

#include <cstdio>
#include <utility>

#include <nlohmann/json.hpp>

#include "bountygate/infra/Digest.hpp"
#include "bountygate/infra/Logger.hpp"
#include "bountygate/storage/Storage.hpp"

namespace bountygate {

AuditTrail::AuditTrail(Logger& log, Storage* storage)
    : log_(log),
      storage_(storage) {}

std::string AuditTrail::canonical(const AuditRecord& r) {
    char conf[32];
    std::snprintf(conf, sizeof(conf), "%.6f", r.confidence);

    std::string out;
    out.reserve(r.target.size() + r.action_kind.size() + r.reason.size() + 64);
    out += r.target;
    out += '|';
    out += r.action_kind;
    out += '|';
    out += to_string(r.decision);
    out += '|';
    out += r.reason;
    out += '|';
    out += conf;
    out += '|';
    out += std::to_string(r.timestamp_ms);
    return out;
}

AuditRecord AuditTrail::append(const std::string& target,
                               const std::string& action_kind,
                               const PolicyDecision& decision) {
    AuditRecord rec;
    rec.target = target;
    rec.action_kind = action_kind;
    rec.decision = decision.decision;
    rec.reason = decision.reason;
    rec.confidence = decision.confidence;

    bool drain_here = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        rec.timestamp_ms = wall_clock_ms();
        rec.digest = sha256_hex(head_ + canonical(rec));
        head_ = rec.digest;

        recent_.push_back(rec);
        if (recent_.size() > kRecentRecords) {
            seed_ = recent_.front().digest;
            recent_.pop_front();
        }

        outbox_.push_back(rec);
        if (!draining_) {
            draining_ = true;
            drain_here = true;
        }
    }

    if (drain_here) drain();
    return rec;
}

void AuditTrail::drain() {
    for (;;) {
        AuditRecord rec;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (outbox_.empty()) {
                draining_ = false;
                return;
            }
            rec = std::move(outbox_.front());
            outbox_.pop_front();
        }

        nlohmann::json line = {
            {"target", rec.target},
            {"action", rec.action_kind},
            {"decision", to_string(rec.decision)},
            {"reason", rec.reason},
            {"confidence", rec.confidence},
            {"digest", rec.digest}
        };
        log_.info("POLICY", line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

        if (storage_ && !storage_->append_policy_decision(rec)) {
            log_.warn("POLICY", "failed to persist decision for " + rec.target +
                                " (" + rec.action_kind + ")");
        }
    }
}

std::vector<AuditRecord> AuditTrail::records() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<AuditRecord>(recent_.begin(), recent_.end());
}

std::string AuditTrail::head_digest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return head_;
}

std::string AuditTrail::tail_seed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return seed_;
}

bool AuditTrail::verify_chain(const std::vector<AuditRecord>& records,
                              const std::string& seed) {
    std::string prev = seed;
    for (const auto& r : records) {
        if (sha256_hex(prev + canonical(r)) != r.digest) return false;
        prev = r.digest;
    }
    return true;
}

} // namespace bountygate
