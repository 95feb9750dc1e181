#include "bountygate/pipeline/RunStateMachine.hpp"

#include <stdexcept>

#include "bountygate/infra/Sanitizer.hpp"

namespace bountygate {

const char* to_string(PipelineStage s) {
    switch (s) {
        case PipelineStage::ScopeCheck: return "scope_check";
        case PipelineStage::Recon:      return "recon";
        case PipelineStage::Probe:      return "probe";
        case PipelineStage::Crawl:      return "crawl";
        case PipelineStage::Scan:       return "scan";
        case PipelineStage::Triage:     return "triage";
        case PipelineStage::Report:     return "report";
        case PipelineStage::Completed:  return "completed";
        case PipelineStage::Failed:     return "failed";
    }
    return "failed";
}

RunStateMachine::RunStateMachine(ScanMode mode)
    : mode_(mode) {
    history_.push_back(stage_);
}

bool RunStateMachine::terminal() const {
    return stage_ == PipelineStage::Completed || stage_ == PipelineStage::Failed;
}

PipelineStage RunStateMachine::next_of(PipelineStage s) const {
    switch (s) {
        case PipelineStage::ScopeCheck: return PipelineStage::Recon;
        case PipelineStage::Recon:      return PipelineStage::Probe;
        case PipelineStage::Probe:
            return mode_ == ScanMode::PassiveOnly ? PipelineStage::Completed : PipelineStage::Crawl;
        case PipelineStage::Crawl:      return PipelineStage::Scan;
        case PipelineStage::Scan:       return PipelineStage::Triage;
        case PipelineStage::Triage:     return PipelineStage::Report;
        case PipelineStage::Report:     return PipelineStage::Completed;
        case PipelineStage::Completed:
        case PipelineStage::Failed:
            break;
    }
    throw std::logic_error(std::string("no transition out of terminal stage ") + to_string(s));
}

PipelineStage RunStateMachine::advance() {
    stage_ = next_of(stage_);
    history_.push_back(stage_);
    return stage_;
}

void RunStateMachine::fail(const std::string& reason) {
    if (terminal()) {
        throw std::logic_error(std::string("cannot fail a run already ") + to_string(stage_));
    }
    failed_at_ = stage_;
    reason_ = reason;
    stage_ = PipelineStage::Failed;
    history_.push_back(stage_);
}

// ---------------------------------------------------------------------------

std::string RunIdGenerator::next(const std::string& target) {
    int64_t ms = wall_clock_ms();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (ms <= last_ms_) ms = last_ms_ + 1;
        last_ms_ = ms;
    }
    return std::to_string(ms) + "_" + sanitize_filename(target);
}

} // namespace bountygate
