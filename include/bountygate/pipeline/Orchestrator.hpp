#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "bountygate/core/Types.hpp"
#include "bountygate/pipeline/Collaborators.hpp"
#include "bountygate/pipeline/RunStateMachine.hpp"
#include "bountygate/policy/ScopeDefinition.hpp"

namespace bountygate {

class CancelToken;
class Logger;
class OverrideChannel;
class PolicyGate;
class RateLimiter;
class Storage;
class TriageScorer;

enum class PipelineOutcome : uint8_t {
    Completed,
    PolicyStop,
    Failed
};

const char* to_string(PipelineOutcome o);

struct PipelineResult {
    PipelineOutcome outcome = PipelineOutcome::Failed;
    bool success = false;
    std::string reason;
    std::string run_id;
    std::string target;
    std::vector<FindingRecord> findings;
    std::string report_location;
};

// Everything a run talks to. Owned by main(); the orchestrator only
// borrows. Optional adapters may be null: a missing crawl or scan adapter
// skips that stage, a missing reporter skips publishing.
struct PipelineServices {
    PolicyGate& gate;
    RateLimiter& limiter;
    TriageScorer& scorer;
    Storage& storage;
    Logger& log;
    ReconAdapter& recon;
    CrawlAdapter* crawl = nullptr;
    ScanAdapter* scan = nullptr;
    Reporter* reporter = nullptr;
    OverrideChannel* override_channel = nullptr;
};

struct OrchestratorOptions {
    ScanMode mode = ScanMode::SafeScan;
    bool override_enabled = false;          // config AND command line
    std::string output_dir = "./outputs";
    int crawl_seed_limit = 5;
    int max_concurrency = 4;
    std::string scan_severity = "low,medium";
    std::chrono::seconds tool_timeout{20};
    std::chrono::seconds run_timeout{0};    // 0 = none
};

// ---------------------------------------------------------------------------
// Orchestrator - drives one target through RunStateMachine.
//
// Policy stops (blocked_by_policy, unknown_scope, override_declined) are
// reported as PipelineOutcome::PolicyStop; everything else that ends a run
// early is Failed. Exactly one terminal run status is persisted per run.
// Exceptions escaping a stage are logged with target, run id and stage and
// turned into a Failed result.
// ---------------------------------------------------------------------------
class Orchestrator {
public:
    Orchestrator(PipelineServices services, OrchestratorOptions opts);

    // `cancel` (may be null) aborts the run at the next stage boundary or
    // rate-limiter wait.
    PipelineResult run(const std::string& target,
                       const std::optional<ScopeDefinition>& scope,
                       const CancelToken* cancel = nullptr);

    // Re-publishes the persisted findings of an earlier run.
    PipelineResult generate_report_only(const std::string& run_id);

private:
    struct RunContext;

    void stage_scope(RunContext& ctx);
    void stage_recon(RunContext& ctx);
    void stage_probe(RunContext& ctx);
    void stage_crawl(RunContext& ctx);
    void stage_scan(RunContext& ctx);
    void stage_triage(RunContext& ctx);
    void stage_report(RunContext& ctx);

    void stop(RunContext& ctx, PipelineOutcome outcome, const std::string& reason);
    void write_recon(const RunContext& ctx);
    bool write_json(const std::string& path, const nlohmann::json& doc);

    PipelineServices svc_;
    OrchestratorOptions opts_;
    RunIdGenerator ids_;
};

} // namespace bountygate
