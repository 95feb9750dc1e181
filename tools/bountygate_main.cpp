// ---------------------------------------------------------------------------
// bountygate - policy-gated, rate-limited reconnaissance and scanning.
//
// Usage:
//   bountygate --target example.com [--scope-file scope.json] [options]
//   bountygate --targets-file targets.txt [options]
//   bountygate --generate-report-only --run-id <id> [options]
//
// Exit codes: 0 every target succeeded, 1 any target failed,
//             2 configuration or usage error.
// ---------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <curl/curl.h>

#include "bountygate/advisory/AdvisoryService.hpp"
#include "bountygate/advisory/GeminiTransport.hpp"
#include "bountygate/infra/Config.hpp"
#include "bountygate/infra/Logger.hpp"
#include "bountygate/pipeline/CommandAdapters.hpp"
#include "bountygate/pipeline/Orchestrator.hpp"
#include "bountygate/policy/AuditTrail.hpp"
#include "bountygate/policy/OverrideChannel.hpp"
#include "bountygate/policy/PolicyGate.hpp"
#include "bountygate/policy/RuleManifest.hpp"
#include "bountygate/policy/ScopeDefinition.hpp"
#include "bountygate/report/JsonReportWriter.hpp"
#include "bountygate/runtime/CancelToken.hpp"
#include "bountygate/storage/SqliteStorage.hpp"
#include "bountygate/throttle/RateLimiter.hpp"
#include "bountygate/triage/TriageModel.hpp"
#include "bountygate/triage/TriageScorer.hpp"

using namespace bountygate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

// Only thing the signal handler touches.
std::atomic<bool> g_stop_flag{false};

void handle_stop(int) {
    g_stop_flag.store(true);
}

struct CliArgs {
    std::vector<std::string> targets;
    std::string targets_file;
    std::string scope_file;
    std::string output_dir;
    std::string env_file = ".env";
    std::string run_id;
    ScanMode mode = ScanMode::SafeScan;
    bool allow_unblock = false;
    bool report_only = false;
};

void usage(std::ostream& out) {
    out << "Usage:\n"
        << "  bountygate --target <domain> [--scope-file <json>] [options]\n"
        << "  bountygate --targets-file <file> [--scope-file <json>] [options]\n"
        << "  bountygate --generate-report-only --run-id <id> [options]\n"
        << "\n"
        << "Options:\n"
        << "  --mode passive-only|safe-scan|full-scan-with-validation  (default safe-scan)\n"
        << "  --allow-unblock      permit manual override of UNKNOWN scope\n"
        << "                       (also requires ALLOW_MANUAL_UNBLOCK=true)\n"
        << "  --output-dir <dir>   overrides OUTPUT_DIR\n"
        << "  --env-file <file>    .env file to load (default .env)\n";
}

// Returns an error message, or empty on success.
std::string parse_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string v;
        if (a == "--target") {
            if (!value(v)) return "--target needs a value";
            args.targets.push_back(v);
        } else if (a == "--targets-file") {
            if (!value(args.targets_file)) return "--targets-file needs a value";
        } else if (a == "--scope-file") {
            if (!value(args.scope_file)) return "--scope-file needs a value";
        } else if (a == "--output-dir") {
            if (!value(args.output_dir)) return "--output-dir needs a value";
        } else if (a == "--env-file") {
            if (!value(args.env_file)) return "--env-file needs a value";
        } else if (a == "--run-id") {
            if (!value(args.run_id)) return "--run-id needs a value";
        } else if (a == "--mode") {
            if (!value(v)) return "--mode needs a value";
            auto m = scan_mode_from_string(v);
            if (!m) return "unknown mode: " + v;
            args.mode = *m;
        } else if (a == "--allow-unblock") {
            args.allow_unblock = true;
        } else if (a == "--generate-report-only") {
            args.report_only = true;
        } else if (a == "--help" || a == "-h") {
            return "help";
        } else {
            return "unknown argument: " + a;
        }
    }

    if (args.report_only) {
        if (args.run_id.empty()) return "--generate-report-only requires --run-id";
        return "";
    }
    if (args.targets.empty() && args.targets_file.empty()) {
        return "one of --target or --targets-file is required";
    }
    return "";
}

// One target per line; blank lines and '#' comments ignored.
std::vector<std::string> read_targets_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("cannot open targets file: " + path);

    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        const auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos || line[b] == '#') continue;
        const auto e = line.find_last_not_of(" \t\r");
        out.push_back(line.substr(b, e - b + 1));
    }
    if (out.empty()) throw ConfigError("targets file lists no targets: " + path);
    return out;
}

void print_summary(const std::vector<PipelineResult>& results) {
    std::cout << "\n"
              << std::left << std::setw(40) << "TARGET"
              << std::setw(13) << "OUTCOME"
              << std::setw(10) << "FINDINGS"
              << "RUN / REASON\n";
    std::cout << std::string(100, '-') << "\n";
    for (const auto& r : results) {
        std::cout << std::left << std::setw(40) << r.target.substr(0, 39)
                  << std::setw(13) << to_string(r.outcome)
                  << std::setw(10) << r.findings.size()
                  << r.run_id;
        if (!r.reason.empty()) std::cout << " (" << r.reason << ")";
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    const std::string arg_error = parse_args(argc, argv, args);
    if (arg_error == "help") {
        usage(std::cout);
        return kExitOk;
    }
    if (!arg_error.empty()) {
        std::cerr << "[BOUNTYGATE] " << arg_error << "\n\n";
        usage(std::cerr);
        return kExitUsage;
    }

    // -----------------------------------------------------------------------
    // Configuration. Everything that can be rejected is rejected here,
    // before any network, process or database side effect.
    // -----------------------------------------------------------------------
    load_dotenv(args.env_file);

    Config cfg;
    std::optional<ScopeDefinition> scope;
    std::optional<RuleManifest> manifest;
    std::vector<std::string> targets = args.targets;
    try {
        cfg = Config::from_env();
        if (!args.output_dir.empty()) cfg.output_dir = args.output_dir;
        if (!args.scope_file.empty()) scope = ScopeDefinition::load_file(args.scope_file);
        manifest = cfg.rule_manifest_path.empty() ? RuleManifest::defaults()
                                                  : RuleManifest::load_file(cfg.rule_manifest_path);
        if (!args.targets_file.empty()) {
            auto more = read_targets_file(args.targets_file);
            targets.insert(targets.end(), more.begin(), more.end());
        }
        // Validate tool command lines up front.
        split_command(cfg.recon_cmd);
        split_command(cfg.probe_cmd);
        split_command(cfg.crawl_cmd);
        split_command(cfg.scan_cmd);
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n";
        return kExitUsage;
    }

    Logger log(cfg.log_level, cfg.log_format, std::cout);
    if (!log.open_file(cfg.log_dir)) {
        log.warn("BOUNTYGATE", "file logging unavailable in " + cfg.log_dir);
    }
    cfg.report_warnings(log);

    std::unique_ptr<RateLimiter> limiter;
    try {
        limiter = std::make_unique<RateLimiter>(RateBudget{cfg.scan_rate, cfg.max_concurrency});
    } catch (const ConfigError& e) {
        log.error("CONFIG", e.what());
        return kExitUsage;
    }

    std::unique_ptr<SqliteStorage> storage;
    try {
        storage = std::make_unique<SqliteStorage>(cfg.db_path, log);
    } catch (const std::runtime_error& e) {
        log.error("DB", e.what());
        return kExitFailed;
    }

    TriageModel model;
    if (std::filesystem::exists(cfg.model_path)) {
        try {
            model = TriageModel::load_file(cfg.model_path);
            log.info("TRIAGE", "model loaded: " + std::to_string(model.feature_count()) + " features");
        } catch (const std::runtime_error& e) {
            log.warn("TRIAGE", std::string(e.what()) + "; using neutral ML score");
        }
    } else {
        log.info("TRIAGE", "no model at " + cfg.model_path + "; using neutral ML score");
    }

    curl_global_init(CURL_GLOBAL_ALL);

    std::unique_ptr<GeminiTransport> transport;
    std::unique_ptr<AdvisoryService> advisory;
    if (cfg.advisory_enabled) {
        GeminiSettings gs;
        gs.api_key = cfg.gemini_api_key;
        gs.model = cfg.gemini_model;
        gs.endpoint = cfg.gemini_endpoint;
        gs.timeout_sec = cfg.timeout_sec;
        transport = std::make_unique<GeminiTransport>(gs, log);
        advisory = std::make_unique<AdvisoryService>(*transport, log, storage.get(),
                                                     cfg.store_llm_responses);
    }

    // -----------------------------------------------------------------------
    // Wiring
    // -----------------------------------------------------------------------
    AuditTrail audit(log, storage.get());
    PolicyGate gate(*manifest, audit, log, advisory.get());
    TriageScorer scorer(model, advisory.get(), TriageWeights{cfg.ml_weight, cfg.llm_weight}, log);
    ConsoleOverrideChannel console(std::cin, std::cout);

    const auto tool_timeout = std::chrono::seconds(cfg.timeout_sec);
    CommandReconAdapter recon(cfg.recon_cmd, cfg.probe_cmd, tool_timeout, log);
    std::unique_ptr<CommandCrawlAdapter> crawl;
    if (!cfg.crawl_cmd.empty()) {
        crawl = std::make_unique<CommandCrawlAdapter>(cfg.crawl_cmd, tool_timeout, log);
    }
    std::unique_ptr<CommandScanAdapter> scan;
    if (!cfg.scan_cmd.empty()) {
        scan = std::make_unique<CommandScanAdapter>(cfg.scan_cmd, cfg.scan_template, log);
    }
    JsonReportWriter reporter(cfg.output_dir, ReportPolicy{cfg.min_report_score}, log);

    PipelineServices services{gate, *limiter, scorer, *storage, log, recon,
                              crawl.get(), scan.get(), &reporter, &console};

    OrchestratorOptions opts;
    opts.mode = args.mode;
    opts.override_enabled = cfg.allow_manual_unblock && args.allow_unblock;
    opts.output_dir = cfg.output_dir;
    opts.crawl_seed_limit = cfg.crawl_seed_limit;
    opts.max_concurrency = cfg.max_concurrency;
    opts.scan_severity = cfg.scan_severity;
    opts.tool_timeout = tool_timeout;
    opts.run_timeout = std::chrono::seconds(cfg.run_timeout_sec);

    Orchestrator orchestrator(services, opts);

    if (args.allow_unblock && !cfg.allow_manual_unblock) {
        log.warn("POLICY", "--allow-unblock ignored: ALLOW_MANUAL_UNBLOCK is not enabled");
    }

    int exit_code = kExitOk;

    if (args.report_only) {
        const PipelineResult r = orchestrator.generate_report_only(args.run_id);
        if (r.success) {
            log.info("REPORT", "report regenerated: " + r.report_location);
        } else {
            log.error("REPORT", "report regeneration failed: " + r.reason);
            exit_code = kExitFailed;
        }
        curl_global_cleanup();
        return exit_code;
    }

    // -----------------------------------------------------------------------
    // Runs. SIGINT/SIGTERM only set a flag; a watcher thread turns it into
    // a cancel on the shared token.
    // -----------------------------------------------------------------------
    CancelToken cancel;
    std::atomic<bool> done{false};
    std::signal(SIGINT, handle_stop);
    std::signal(SIGTERM, handle_stop);
    std::thread watcher([&]() {
        while (!done.load()) {
            if (g_stop_flag.load()) {
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::vector<PipelineResult> results;
    for (const auto& t : targets) {
        if (cancel.cancelled()) {
            log.warn("BOUNTYGATE", "cancelled; skipping remaining targets");
            break;
        }
        results.push_back(orchestrator.run(t, scope, &cancel));
        if (!results.back().success) exit_code = kExitFailed;
    }
    if (results.size() < targets.size()) exit_code = kExitFailed;

    done.store(true);
    watcher.join();

    print_summary(results);
    curl_global_cleanup();
    return exit_code;
}
