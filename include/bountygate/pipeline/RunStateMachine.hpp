#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "bountygate/core/Types.hpp"

namespace bountygate {

enum class PipelineStage : uint8_t {
    ScopeCheck,
    Recon,
    Probe,
    Crawl,
    Scan,
    Triage,
    Report,
    Completed,
    Failed
};

const char* to_string(PipelineStage s);

// ---------------------------------------------------------------------------
// Run lifecycle:
//
//   ScopeCheck -> Recon -> Probe -> Crawl -> Scan -> Triage -> Report -> Completed
//                                 \-> Completed              (passive-only)
//   any non-terminal stage -> Failed
//
// Completed and Failed are terminal; leaving them is a logic error.
// ---------------------------------------------------------------------------
class RunStateMachine {
public:
    explicit RunStateMachine(ScanMode mode);

    PipelineStage stage() const { return stage_; }
    bool terminal() const;

    // Next stage for the configured mode. Throws std::logic_error when
    // already terminal.
    PipelineStage advance();

    // Throws std::logic_error when already terminal.
    void fail(const std::string& reason);

    const std::string& failure_reason() const { return reason_; }
    // The stage that was active when fail() was called.
    PipelineStage failed_at() const { return failed_at_; }
    const std::vector<PipelineStage>& history() const { return history_; }

private:
    PipelineStage next_of(PipelineStage s) const;

    ScanMode mode_;
    PipelineStage stage_ = PipelineStage::ScopeCheck;
    PipelineStage failed_at_ = PipelineStage::ScopeCheck;
    std::string reason_;
    std::vector<PipelineStage> history_;
};

// "<unix-ms>_<sanitised target>", strictly increasing per process: when the
// clock has not moved past the previous id, previous + 1 ms is used.
class RunIdGenerator {
public:
    std::string next(const std::string& target);

private:
    std::mutex mtx_;
    int64_t last_ms_ = 0;
};

} // namespace bountygate
