#include "bountygate/pipeline/Orchestrator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "bountygate/infra/Logger.hpp"
#include "bountygate/infra/Sanitizer.hpp"
#include "bountygate/policy/OverrideChannel.hpp"
#include "bountygate/policy/PolicyGate.hpp"
#include "bountygate/runtime/CancelToken.hpp"
#include "bountygate/storage/Storage.hpp"
#include "bountygate/throttle/RateLimiter.hpp"
#include "bountygate/triage/TriageScorer.hpp"

namespace bountygate {

const char* to_string(PipelineOutcome o) {
    switch (o) {
        case PipelineOutcome::Completed:  return "completed";
        case PipelineOutcome::PolicyStop: return "policy_stop";
        case PipelineOutcome::Failed:     return "failed";
    }
    return "failed";
}

struct Orchestrator::RunContext {
    RunContext(ScanMode mode, const CancelToken* parent)
        : sm(mode),
          token(parent) {}

    RunStateMachine sm;
    CancelToken token;
    PipelineResult result;

    std::string target;
    std::string run_dir;
    const std::optional<ScopeDefinition>* scope = nullptr;

    std::vector<std::string> subdomains;
    std::vector<std::string> live_hosts;
    std::vector<std::string> urls;
    std::vector<std::string> recon_errors;
    std::vector<FindingRecord> findings;
};

Orchestrator::Orchestrator(PipelineServices services, OrchestratorOptions opts)
    : svc_(services),
      opts_(std::move(opts)) {
    if (opts_.max_concurrency < 1) opts_.max_concurrency = 1;
    if (opts_.crawl_seed_limit < 0) opts_.crawl_seed_limit = 0;
}

void Orchestrator::stop(RunContext& ctx, PipelineOutcome outcome, const std::string& reason) {
    ctx.result.outcome = outcome;
    ctx.result.reason = reason;
    ctx.sm.fail(reason);
}

bool Orchestrator::write_json(const std::string& path, const nlohmann::json& doc) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        svc_.log.warn("PIPELINE", "cannot write " + path);
        return false;
    }
    out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return static_cast<bool>(out);
}

void Orchestrator::write_recon(const RunContext& ctx) {
    write_json(ctx.run_dir + "/recon.json", nlohmann::json{
        {"target", ctx.target},
        {"run_id", ctx.result.run_id},
        {"subdomains", ctx.subdomains},
        {"live_hosts", ctx.live_hosts},
        {"urls", ctx.urls},
        {"errors", ctx.recon_errors}
    });
}

// ---------------------------------------------------------------------------
// Stage: ScopeCheck
// ---------------------------------------------------------------------------
void Orchestrator::stage_scope(RunContext& ctx) {
    const PolicyDecision d = svc_.gate.validate_scope(ctx.target, *ctx.scope);

    switch (d.decision) {
        case Decision::Allowed:
            svc_.log.info("PIPELINE", ctx.target + " in scope: " + d.reason);
            ctx.sm.advance();
            return;

        case Decision::Blocked:
            svc_.log.warn("PIPELINE", ctx.target + " blocked: " + d.reason);
            stop(ctx, PipelineOutcome::PolicyStop, "blocked_by_policy");
            return;

        case Decision::Unknown:
        case Decision::RequiresValidation:
            break;
    }

    if (!opts_.override_enabled) {
        svc_.log.warn("PIPELINE", ctx.target + " scope unknown: " + d.reason);
        stop(ctx, PipelineOutcome::PolicyStop, "unknown_scope");
        return;
    }
    if (!svc_.override_channel || !svc_.gate.confirm_override(ctx.target, *svc_.override_channel)) {
        stop(ctx, PipelineOutcome::PolicyStop, "override_declined");
        return;
    }
    svc_.log.warn("PIPELINE", ctx.target + " proceeding under manual override");
    ctx.sm.advance();
}

// ---------------------------------------------------------------------------
// Stage: Recon / Probe
// ---------------------------------------------------------------------------
void Orchestrator::stage_recon(RunContext& ctx) {
    ReconResult r = svc_.recon.enumerate(ctx.target);
    if (r.ok) {
        ctx.subdomains = std::move(r.hosts);
    } else {
        svc_.log.warn("RECON", "enumeration failed for " + ctx.target + ": " + r.error);
        ctx.recon_errors.push_back("enumerate: " + r.error);
    }
    if (ctx.subdomains.empty()) ctx.subdomains.push_back(ctx.target);

    svc_.log.info("RECON", ctx.target + ": " + std::to_string(ctx.subdomains.size()) + " hosts");
    ctx.sm.advance();
}

void Orchestrator::stage_probe(RunContext& ctx) {
    ReconResult r = svc_.recon.probe(ctx.subdomains);
    if (r.ok) {
        ctx.live_hosts = std::move(r.hosts);
    } else {
        svc_.log.warn("RECON", "probing failed for " + ctx.target + ": " + r.error);
        ctx.recon_errors.push_back("probe: " + r.error);
        ctx.live_hosts = {ctx.target};
    }

    svc_.log.info("RECON", ctx.target + ": " + std::to_string(ctx.live_hosts.size()) + " live hosts");
    write_recon(ctx);
    ctx.sm.advance();
}

// ---------------------------------------------------------------------------
// Stage: Crawl
// ---------------------------------------------------------------------------
void Orchestrator::stage_crawl(RunContext& ctx) {
    if (!svc_.crawl) {
        svc_.log.info("CRAWL", "no crawler configured, skipping");
        ctx.sm.advance();
        return;
    }

    const size_t seeds = std::min(ctx.live_hosts.size(), static_cast<size_t>(opts_.crawl_seed_limit));
    size_t failures = 0;
    for (size_t i = 0; i < seeds; ++i) {
        if (ctx.token.cancelled()) return;

        CrawlResult r = svc_.crawl->crawl(ctx.live_hosts[i]);
        if (!r.ok) {
            ++failures;
            svc_.log.warn("CRAWL", ctx.live_hosts[i] + ": " + r.error);
            continue;
        }
        ctx.urls.insert(ctx.urls.end(), r.urls.begin(), r.urls.end());
    }

    svc_.log.info("CRAWL", std::to_string(seeds) + " seeds, " + std::to_string(ctx.urls.size()) +
                           " urls, " + std::to_string(failures) + " failed");
    write_recon(ctx);
    ctx.sm.advance();
}

// ---------------------------------------------------------------------------
// Stage: Scan
//
// Authorisation is sequential so the audit order is deterministic; the
// authorised hosts then run on a bounded pool, each worker holding a rate
// limiter permit for the duration of its scan.
// ---------------------------------------------------------------------------
void Orchestrator::stage_scan(RunContext& ctx) {
    if (!svc_.scan) {
        svc_.log.warn("SCAN", "no scanner configured, skipping");
        ctx.sm.advance();
        return;
    }

    std::vector<std::string> queue;
    std::optional<bool> validated;
    for (const auto& host : ctx.live_hosts) {
        if (ctx.token.cancelled()) return;

        ActionDescriptor action;
        action.scanner_kind = svc_.scan->scanner_kind();
        action.target = host;
        action.template_or_rule_id = svc_.scan->template_id();
        action.severity_hint = opts_.scan_severity;

        const PolicyDecision d = svc_.gate.validate_action(action);
        switch (d.decision) {
            case Decision::Allowed:
                queue.push_back(host);
                break;
            case Decision::RequiresValidation:
                if (opts_.mode != ScanMode::FullScanWithValidation) {
                    svc_.log.warn("SCAN", host + ": skipped, not in validated mode (" + d.reason + ")");
                    break;
                }
                // One operator answer covers the scan template for the whole run.
                if (!validated) {
                    validated = svc_.override_channel &&
                                svc_.gate.confirm_validation(action, *svc_.override_channel);
                }
                if (*validated) {
                    queue.push_back(host);
                } else {
                    svc_.log.warn("SCAN", host + ": skipped, validation unresolved (" + d.reason + ")");
                }
                break;
            case Decision::Blocked:
            case Decision::Unknown:
                svc_.log.warn("SCAN", host + ": skipped, " + to_string(d.decision) + " (" + d.reason + ")");
                break;
        }
    }

    ScanConstraints constraints;
    constraints.severity = opts_.scan_severity;
    constraints.template_id = svc_.scan->template_id();
    constraints.timeout = opts_.tool_timeout;

    std::mutex collect_mtx;
    std::vector<FindingRecord> collected;
    size_t failures = 0;

    {
        boost::asio::thread_pool pool(static_cast<size_t>(opts_.max_concurrency));
        for (const auto& host : queue) {
            boost::asio::post(pool, [&, host]() {
                if (ctx.token.cancelled()) return;

                ScopedPermit permit(svc_.limiter, &ctx.token);
                if (!permit.held()) return;

                ScanResult r;
                try {
                    r = svc_.scan->run(host, constraints);
                } catch (const std::exception& e) {
                    r.ok = false;
                    r.error = std::string("scanner threw: ") + e.what();
                }

                std::lock_guard<std::mutex> lock(collect_mtx);
                if (!r.ok) {
                    ++failures;
                    svc_.log.warn("SCAN", host + ": " + r.error);
                    return;
                }
                collected.insert(collected.end(),
                                 std::make_move_iterator(r.findings.begin()),
                                 std::make_move_iterator(r.findings.end()));
            });
        }
        pool.join();
    }

    if (ctx.token.cancelled()) return;

    ctx.findings = std::move(collected);
    svc_.log.info("SCAN", std::to_string(queue.size()) + "/" + std::to_string(ctx.live_hosts.size()) +
                          " hosts scanned, " + std::to_string(ctx.findings.size()) + " findings, " +
                          std::to_string(failures) + " failed");
    ctx.sm.advance();
}

// ---------------------------------------------------------------------------
// Stage: Triage
// ---------------------------------------------------------------------------
void Orchestrator::stage_triage(RunContext& ctx) {
    size_t failures = 0;
    for (auto& f : ctx.findings) {
        if (ctx.token.cancelled()) return;
        try {
            TriageScorer::apply(svc_.scorer.score(f), f);
        } catch (const std::exception& e) {
            ++failures;
            TriageScorer::apply(TriageScorer::neutral(f, std::string("triage failed: ") + e.what()), f);
            svc_.log.error("TRIAGE", "'" + f.name + "' on " + f.target + ": " + e.what());
        }
    }

    std::stable_sort(ctx.findings.begin(), ctx.findings.end(),
        [](const FindingRecord& a, const FindingRecord& b) { return a.final_score > b.final_score; });

    nlohmann::json doc = nlohmann::json::array();
    for (const auto& f : ctx.findings) {
        if (!svc_.storage.save_finding(ctx.result.run_id, f)) {
            svc_.log.warn("TRIAGE", "failed to persist '" + f.name + "'");
        }
        doc.push_back(to_json(f));
    }
    write_json(ctx.run_dir + "/findings.json", doc);

    if (failures) {
        svc_.log.warn("TRIAGE", std::to_string(failures) + " findings could not be scored");
    }
    ctx.sm.advance();
}

// ---------------------------------------------------------------------------
// Stage: Report
// ---------------------------------------------------------------------------
void Orchestrator::stage_report(RunContext& ctx) {
    if (!svc_.reporter) {
        svc_.log.info("REPORT", "no reporter configured, skipping");
        ctx.sm.advance();
        return;
    }

    auto location = svc_.reporter->publish(ctx.result.run_id, ctx.target, ctx.findings);
    if (!location) {
        stop(ctx, PipelineOutcome::Failed, "report_failed");
        return;
    }
    ctx.result.report_location = *location;
    ctx.sm.advance();
}

// ---------------------------------------------------------------------------
// Run loop
// ---------------------------------------------------------------------------
PipelineResult Orchestrator::run(const std::string& target,
                                 const std::optional<ScopeDefinition>& scope,
                                 const CancelToken* cancel) {
    RunContext ctx(opts_.mode, cancel);
    ctx.token.set_timeout(opts_.run_timeout);
    ctx.scope = &scope;
    ctx.result.target = target;

    const auto clean = sanitize_domain(target);
    ctx.result.run_id = ids_.next(clean ? *clean : target);
    if (!clean) {
        svc_.log.error("PIPELINE", "invalid target: " + target.substr(0, 253));
        ctx.result.outcome = PipelineOutcome::Failed;
        ctx.result.reason = "invalid_target";
        return ctx.result;
    }
    ctx.target = *clean;
    ctx.result.target = *clean;

    const std::filesystem::path run_dir = std::filesystem::path(opts_.output_dir) / ctx.result.run_id;
    ctx.run_dir = run_dir.string();
    std::error_code ec;
    std::filesystem::create_directories(run_dir, ec);
    if (ec) {
        svc_.log.error("PIPELINE", "cannot create " + ctx.run_dir + ": " + ec.message());
        ctx.result.outcome = PipelineOutcome::Failed;
        ctx.result.reason = "output_dir_unavailable";
        return ctx.result;
    }

    RunRecord rec;
    rec.run_id = ctx.result.run_id;
    rec.target = ctx.target;
    rec.mode = opts_.mode;
    rec.output_location = ctx.run_dir;
    rec.status = RunStatus::Running;
    rec.start_time_ms = wall_clock_ms();
    if (!svc_.storage.create_run(rec)) {
        svc_.log.warn("PIPELINE", "run record not persisted for " + rec.run_id);
    }

    svc_.log.info("PIPELINE", "run " + rec.run_id + " started (" + to_string(opts_.mode) + ")");

    try {
        while (!ctx.sm.terminal()) {
            if (ctx.token.cancelled()) {
                stop(ctx, PipelineOutcome::Failed, "cancelled");
                break;
            }
            switch (ctx.sm.stage()) {
                case PipelineStage::ScopeCheck: stage_scope(ctx);  break;
                case PipelineStage::Recon:      stage_recon(ctx);  break;
                case PipelineStage::Probe:      stage_probe(ctx);  break;
                case PipelineStage::Crawl:      stage_crawl(ctx);  break;
                case PipelineStage::Scan:       stage_scan(ctx);   break;
                case PipelineStage::Triage:     stage_triage(ctx); break;
                case PipelineStage::Report:     stage_report(ctx); break;
                case PipelineStage::Completed:
                case PipelineStage::Failed:
                    break;
            }
        }
    } catch (const std::exception& e) {
        const PipelineStage at = ctx.sm.stage();
        svc_.log.error("PIPELINE", "target=" + ctx.target + " run_id=" + ctx.result.run_id +
                                   " stage=" + to_string(at) + ": " + e.what());
        if (!ctx.sm.terminal()) {
            stop(ctx, PipelineOutcome::Failed, std::string("error in ") + to_string(at) + ": " + e.what());
        } else {
            ctx.result.outcome = PipelineOutcome::Failed;
            ctx.result.reason = std::string("error after ") + to_string(at) + ": " + e.what();
        }
    }

    const bool completed = ctx.sm.stage() == PipelineStage::Completed &&
                           ctx.result.reason.empty();
    if (completed) {
        ctx.result.outcome = PipelineOutcome::Completed;
        ctx.result.success = true;
    }
    ctx.result.findings = ctx.findings;

    if (!svc_.storage.update_run_status(ctx.result.run_id,
                                        completed ? RunStatus::Completed : RunStatus::Failed,
                                        static_cast<uint32_t>(ctx.findings.size()))) {
        svc_.log.warn("PIPELINE", "final status not persisted for " + ctx.result.run_id);
    }

    if (completed) {
        svc_.log.info("PIPELINE", "run " + ctx.result.run_id + " completed, " +
                                  std::to_string(ctx.findings.size()) + " findings");
    } else {
        svc_.log.warn("PIPELINE", "run " + ctx.result.run_id + " ended: " + ctx.result.reason +
                                  " (" + to_string(ctx.result.outcome) + ")");
    }
    return ctx.result;
}

PipelineResult Orchestrator::generate_report_only(const std::string& run_id) {
    PipelineResult result;
    result.run_id = run_id;

    const auto run = svc_.storage.get_run(run_id);
    if (!run) {
        result.reason = "unknown_run";
        svc_.log.error("REPORT", "no run " + run_id);
        return result;
    }
    result.target = run->target;

    result.findings = svc_.storage.list_findings(run_id);
    if (result.findings.empty()) {
        result.reason = "no_findings";
        svc_.log.error("REPORT", "run " + run_id + " has no findings");
        return result;
    }
    if (!svc_.reporter) {
        result.reason = "no_reporter";
        return result;
    }

    auto location = svc_.reporter->publish(run_id, run->target, result.findings);
    if (!location) {
        result.reason = "report_failed";
        return result;
    }

    result.report_location = *location;
    result.outcome = PipelineOutcome::Completed;
    result.success = true;
    return result;
}

} // namespace bountygate
