// Run state machine, command adapters and end-to-end orchestration with
// in-process collaborators.

#include "TestSupport.hpp"

#include <filesystem>
#include <stdexcept>

#include "bountygate/advisory/AdvisoryService.hpp"
#include "bountygate/infra/Config.hpp"
#include "bountygate/pipeline/CommandAdapters.hpp"
#include "bountygate/pipeline/Orchestrator.hpp"
#include "bountygate/pipeline/RunStateMachine.hpp"
#include "bountygate/policy/AuditTrail.hpp"
#include "bountygate/policy/PolicyGate.hpp"
#include "bountygate/policy/RuleManifest.hpp"
#include "bountygate/runtime/CancelToken.hpp"
#include "bountygate/throttle/RateLimiter.hpp"
#include "bountygate/triage/TriageModel.hpp"
#include "bountygate/triage/TriageScorer.hpp"

using namespace bgtest;
namespace fs = std::filesystem;

namespace {

const std::string kOutDir = (fs::temp_directory_path() / "bountygate_pipeline_test").string();

// Everything a run needs, wired like main() does but with fakes.
struct Harness {
    QuietLog q;
    MemoryStorage store;
    AuditTrail audit{q.log, &store};
    RuleManifest rules = RuleManifest::defaults();
    PolicyGate gate{rules, audit, q.log, nullptr};
    RateLimiter limiter{RateBudget{6000, 4}};
    TriageModel model;
    FakeTransport transport;
    AdvisoryService advisory{transport, q.log, &store, false};
    TriageScorer scorer{model, &advisory, TriageWeights{0.4, 0.6}, q.log};
    FakeRecon recon;
    FakeCrawl crawl;
    FakeScan scan;
    FakeReporter reporter;
    OrchestratorOptions opts;

    Harness() {
        transport.fallback = AdvisoryReply::success(R"({"score": 0.7, "confidence": 0.6})");
        recon.enumerate_result.ok = true;
        recon.enumerate_result.hosts = {"example.com", "api.example.com", "www.example.com"};
        opts.output_dir = kOutDir;
        opts.max_concurrency = 2;
    }

    Orchestrator make(OverrideChannel* channel = nullptr) {
        PipelineServices s{gate, limiter, scorer, store, q.log, recon,
                           &crawl, &scan, &reporter, channel};
        return Orchestrator(s, opts);
    }

    size_t decisions_of(const std::string& kind) {
        size_t n = 0;
        for (const auto& d : store.decisions) n += (d.action_kind == kind) ? 1 : 0;
        return n;
    }
};

std::optional<ScopeDefinition> example_scope() {
    ScopeDefinition s;
    s.in_scope = {"*.example.com"};
    s.out_of_scope = {"dev.example.com"};
    return s;
}

void test_state_machine() {
    RunStateMachine sm(ScanMode::SafeScan);
    assert(sm.stage() == PipelineStage::ScopeCheck);
    const PipelineStage expected[] = {
        PipelineStage::Recon, PipelineStage::Probe, PipelineStage::Crawl, PipelineStage::Scan,
        PipelineStage::Triage, PipelineStage::Report, PipelineStage::Completed};
    for (PipelineStage s : expected) assert(sm.advance() == s);
    assert(sm.terminal());
    assert(sm.history().size() == 8);

    bool threw = false;
    try {
        sm.advance();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    RunStateMachine passive(ScanMode::PassiveOnly);
    passive.advance();
    passive.advance();
    assert(passive.stage() == PipelineStage::Probe);
    assert(passive.advance() == PipelineStage::Completed);

    RunStateMachine failing(ScanMode::FullScanWithValidation);
    failing.advance();
    failing.fail("boom");
    assert(failing.stage() == PipelineStage::Failed);
    assert(failing.failed_at() == PipelineStage::Recon);
    assert(failing.failure_reason() == "boom");
    threw = false;
    try {
        failing.fail("again");
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    assert(std::string(to_string(PipelineStage::ScopeCheck)) == "scope_check");
    std::cout << "[TEST] state machine ok\n";
}

void test_run_ids() {
    RunIdGenerator ids;
    const std::string a = ids.next("Example.com/../x");
    const std::string b = ids.next("Example.com/../x");
    assert(a != b);
    assert(a.find('/') == std::string::npos);
    const auto sep = a.find('_');
    assert(sep != std::string::npos);
    assert(std::stoll(b.substr(0, b.find('_'))) > std::stoll(a.substr(0, sep)));
    std::cout << "[TEST] run ids ok\n";
}

void test_command_helpers() {
    auto argv = split_command("nuclei -u {target} -tags 'a b' \"c d\"");
    assert(argv.size() == 5);
    assert(argv[3] == "a b" && argv[4] == "c d");
    assert(split_command("").empty());
    assert(split_command("x ''").size() == 2);

    bool threw = false;
    try {
        split_command("tool 'oops");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    auto expanded = expand_placeholders({"-u", "https://{target}/", "{severity}"},
                                        {{"target", "api.example.com"}, {"severity", "low"}});
    assert(expanded[1] == "https://api.example.com/");
    assert(expanded[2] == "low");

    size_t rejected = 0;
    auto findings = CommandScanAdapter::parse_findings(
        "{\"name\": \"Missing CSP\", \"severity\": \"low\"}\n"
        "garbage line\n"
        "{\"severity\": \"low\"}\n"
        "{\"name\": \"Open redirect\", \"target\": \"other.example.com\", \"scanner_kind\": \"custom\"}\n",
        "api.example.com", "nuclei", &rejected);
    assert(findings.size() == 2);
    assert(rejected == 2);
    assert(findings[0].target == "api.example.com");
    assert(findings[0].scanner_kind == "nuclei");
    assert(findings[1].target == "other.example.com");
    assert(findings[1].scanner_kind == "custom");

    QuietLog q;
    CommandScanAdapter scanner("/opt/tools/nuclei -t {template}", "tpl-x", q.log);
    assert(scanner.scanner_kind() == "nuclei");
    assert(scanner.template_id() == "tpl-x");

    threw = false;
    try {
        CommandScanAdapter empty("", "tpl", q.log);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[TEST] command helpers ok\n";
}

void test_command_processes() {
    QuietLog q;

    CommandOutput ok = run_command({"/bin/sh", "-c", "echo hello"}, std::chrono::seconds(5));
    assert(ok.ok());
    assert(ok.out == "hello\n");

    CommandOutput fail = run_command({"/bin/sh", "-c", "exit 3"}, std::chrono::seconds(5));
    assert(fail.launched && !fail.ok());
    assert(fail.exit_code == 3);

    CommandOutput slow = run_command({"/bin/sh", "-c", "sleep 5"}, std::chrono::seconds(1));
    assert(slow.timed_out);
    assert(!slow.ok());

    CommandOutput missing = run_command({"bountygate-no-such-tool"}, std::chrono::seconds(1));
    assert(!missing.launched);

    CommandReconAdapter recon(
        "/bin/sh -c 'echo API.example.com; echo not_a_host!; echo api.example.com; echo b.example.com'",
        "", std::chrono::seconds(5), q.log);
    ReconResult r = recon.enumerate("example.com");
    assert(r.ok);
    assert(r.hosts.size() == 3);
    assert(r.hosts[0] == "example.com");
    assert(r.hosts[1] == "api.example.com");

    // exit status decides liveness
    CommandReconAdapter prober("", "/bin/sh -c 'test {target} = b.example.com'",
                               std::chrono::seconds(5), q.log);
    ReconResult live = prober.probe({"a.example.com", "b.example.com"});
    assert(live.ok);
    assert(live.hosts.size() == 1 && live.hosts[0] == "b.example.com");

    CommandReconAdapter passthrough("", "", std::chrono::seconds(5), q.log);
    assert(passthrough.enumerate("example.com").hosts.size() == 1);

    CommandCrawlAdapter crawler("/bin/sh -c 'echo https://{target}/a; echo ftp://x/; echo http://{target}/b'",
                                std::chrono::seconds(5), q.log);
    CrawlResult c = crawler.crawl("example.com");
    assert(c.ok);
    assert(c.urls.size() == 2);
    std::cout << "[TEST] command processes ok\n";
}

void test_full_run() {
    Harness h;
    Orchestrator orch = h.make();

    PipelineResult r = orch.run("example.com", example_scope());
    assert(r.success);
    assert(r.outcome == PipelineOutcome::Completed);
    assert(r.reason.empty());
    assert(r.findings.size() == 3);
    assert(r.report_location == "memory://" + r.run_id);
    assert(h.reporter.calls == 1);

    for (const auto& f : r.findings) {
        assert(near(f.final_score, 0.4 * 0.5 + 0.6 * 0.7));
        assert(!f.is_false_positive);
    }

    auto run = h.store.get_run(r.run_id);
    assert(run && run->status == RunStatus::Completed);
    assert(run->findings_count == 3);
    assert(h.store.status_updates[r.run_id] == 1);
    assert(h.store.findings[r.run_id].size() == 3);

    // one scope decision, one scanner decision per live host, in that order
    assert(h.store.decisions.front().action_kind == "scope_check");
    assert(h.decisions_of("scanner_nuclei") == 3);
    assert(h.scan.scanned_hosts().size() == 3);
    assert(h.crawl.seeds.size() == 3);

    const fs::path dir = fs::path(kOutDir) / r.run_id;
    assert(fs::exists(dir / "recon.json"));
    assert(fs::exists(dir / "findings.json"));

    // report regeneration from storage
    PipelineResult again = orch.generate_report_only(r.run_id);
    assert(again.success);
    assert(again.findings.size() == 3);
    assert(h.reporter.calls == 2);

    assert(orch.generate_report_only("nope").reason == "unknown_run");
    std::cout << "[TEST] full run ok\n";
}

void test_policy_stops() {
    {
        Harness h;
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("dev.example.com", example_scope());
        assert(!r.success);
        assert(r.outcome == PipelineOutcome::PolicyStop);
        assert(r.reason == "blocked_by_policy");
        assert(h.recon.enumerated.empty());
        assert(h.store.get_run(r.run_id)->status == RunStatus::Failed);
        assert(h.store.status_updates[r.run_id] == 1);
    }
    {
        Harness h;
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("other.org", example_scope());
        assert(r.outcome == PipelineOutcome::PolicyStop);
        assert(r.reason == "unknown_scope");
        assert(h.recon.enumerated.empty());
    }
    {
        // override requested but declined
        Harness h;
        h.opts.override_enabled = true;
        ScriptedOverrideChannel no(std::string("yes"));
        Orchestrator orch = h.make(&no);
        PipelineResult r = orch.run("other.org", example_scope());
        assert(r.outcome == PipelineOutcome::PolicyStop);
        assert(r.reason == "override_declined");
        assert(h.decisions_of("manual_override") == 1);
    }
    {
        // override accepted: the run proceeds
        Harness h;
        h.opts.override_enabled = true;
        h.recon.enumerate_result.hosts = {"other.org"};
        ScriptedOverrideChannel yes{std::string(kOverrideToken)};
        Orchestrator orch = h.make(&yes);
        PipelineResult r = orch.run("other.org", std::nullopt);
        assert(r.success);
        assert(r.findings.size() == 1);
        assert(h.decisions_of("manual_override") == 1);
    }
    std::cout << "[TEST] policy stops ok\n";
}

void test_modes_and_actions() {
    {
        Harness h;
        h.opts.mode = ScanMode::PassiveOnly;
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(r.findings.empty());
        assert(h.scan.scanned_hosts().empty());
        assert(h.crawl.seeds.empty());
        assert(h.reporter.calls == 0);
        assert(fs::exists(fs::path(kOutDir) / r.run_id / "recon.json"));
    }
    {
        Harness h;
        h.scan.tpl = "rce-exploit-template";
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(h.scan.scanned_hosts().empty());
        assert(r.findings.empty());
        assert(h.decisions_of("scanner_nuclei") == 3);
    }
    {
        // validated mode without an operator channel: nothing resolves it
        Harness h;
        h.opts.mode = ScanMode::FullScanWithValidation;
        h.scan.tpl = "auth-bypass-check";
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(h.scan.scanned_hosts().empty());
    }
    {
        // validated mode: one operator confirmation releases every host
        Harness h;
        h.opts.mode = ScanMode::FullScanWithValidation;
        h.scan.tpl = "auth-bypass-check";
        ScriptedOverrideChannel yes{std::string(kOverrideToken)};
        Orchestrator orch = h.make(&yes);
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(yes.prompts.size() == 1);
        assert(h.scan.scanned_hosts().size() == 3);
        assert(h.decisions_of("validation_override") == 1);
    }
    {
        Harness h;
        h.opts.mode = ScanMode::FullScanWithValidation;
        h.scan.tpl = "auth-bypass-check";
        ScriptedOverrideChannel no(std::string("yes"));
        Orchestrator orch = h.make(&no);
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(no.prompts.size() == 1);
        assert(h.scan.scanned_hosts().empty());
        assert(h.decisions_of("validation_override") == 1);
    }
    {
        // safe-scan never asks, even with a willing operator
        Harness h;
        h.scan.tpl = "auth-bypass-check";
        ScriptedOverrideChannel yes{std::string(kOverrideToken)};
        Orchestrator orch = h.make(&yes);
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(yes.prompts.empty());
        assert(h.scan.scanned_hosts().empty());
        assert(h.decisions_of("validation_override") == 0);
    }
    {
        Harness h;
        h.opts.crawl_seed_limit = 1;
        Orchestrator orch = h.make();
        orch.run("example.com", example_scope());
        assert(h.crawl.seeds.size() == 1);
    }
    std::cout << "[TEST] modes and actions ok\n";
}

void test_failure_isolation() {
    {
        Harness h;
        h.scan.failing = {"api.example.com"};
        h.scan.throwing = {"www.example.com"};
        h.crawl.by_seed["api.example.com"] = CrawlResult{false, {}, "crawler died"};
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(r.findings.size() == 1);
        assert(r.findings[0].target == "example.com");
    }
    {
        // recon and probe failures degrade to the root target
        Harness h;
        h.recon.enumerate_result = ReconResult{false, {}, "tool missing"};
        h.recon.probe_result = ReconResult{false, {}, "probe missing"};
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(h.recon.probed.size() == 1);
        assert(r.findings.size() == 1);
    }
    {
        Harness h;
        h.reporter.fail = true;
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("example.com", example_scope());
        assert(!r.success);
        assert(r.outcome == PipelineOutcome::Failed);
        assert(r.reason == "report_failed");
        assert(h.store.get_run(r.run_id)->status == RunStatus::Failed);
        assert(h.store.status_updates[r.run_id] == 1);
    }
    {
        // storage outage does not stop the run
        Harness h;
        h.store.fail_writes = true;
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("example.com", example_scope());
        assert(r.success);
        assert(r.findings.size() == 3);
    }
    std::cout << "[TEST] failure isolation ok\n";
}

void test_triage_order() {
    Harness h;
    h.recon.enumerate_result.hosts = {"example.com"};
    FindingRecord a, b, c;
    a.name = "low";
    b.name = "high";
    c.name = "mid";
    h.scan.by_host["example.com"] = {a, b, c};
    h.transport.push(AdvisoryReply::success(R"({"score": 0.1})"));
    h.transport.push(AdvisoryReply::success(R"({"score": 0.9})"));
    h.transport.push(AdvisoryReply::success(R"({"score": 0.6})"));

    Orchestrator orch = h.make();
    PipelineResult r = orch.run("example.com", example_scope());
    assert(r.success);
    assert(r.findings.size() == 3);
    assert(r.findings[0].name == "high");
    assert(r.findings[1].name == "mid");
    assert(r.findings[2].name == "low");
    assert(r.findings[2].is_false_positive);
    std::cout << "[TEST] triage order ok\n";
}

void test_triage_failure_neutral() {
    Harness h;
    h.recon.enumerate_result.hosts = {"example.com"};
    FindingRecord f;
    f.name = "Open redirect";
    f.severity = "High";
    h.scan.by_host["example.com"] = {f};
    h.transport.throwing = true;

    Orchestrator orch = h.make();
    PipelineResult r = orch.run("example.com", example_scope());
    assert(r.success);
    assert(r.findings.size() == 1);
    const FindingRecord& got = r.findings[0];
    assert(near(got.ml_score, 0.5) && near(got.llm_score, 0.5) && near(got.final_score, 0.5));
    assert(near(got.confidence, 0.0));
    assert(got.severity_adjusted == "high");
    assert(!got.is_false_positive);
    assert(got.explanation.find("triage failed") == 0);

    const auto stored = h.store.list_findings(r.run_id);
    assert(stored.size() == 1);
    assert(near(stored[0].final_score, 0.5));
    assert(stored[0].severity_adjusted == "high");
    std::cout << "[TEST] triage failure neutral ok\n";
}

void test_cancel_and_invalid() {
    {
        Harness h;
        Orchestrator orch = h.make();
        CancelToken token;
        token.cancel();
        PipelineResult r = orch.run("example.com", example_scope(), &token);
        assert(!r.success);
        assert(r.outcome == PipelineOutcome::Failed);
        assert(r.reason == "cancelled");
        assert(h.store.get_run(r.run_id)->status == RunStatus::Failed);
        assert(h.store.status_updates[r.run_id] == 1);
    }
    {
        Harness h;
        Orchestrator orch = h.make();
        PipelineResult r = orch.run("exa mple;rm -rf /", example_scope());
        assert(!r.success);
        assert(r.reason == "invalid_target");
        assert(h.store.runs.empty());
        assert(h.store.decisions.empty());
    }
    std::cout << "[TEST] cancel and invalid ok\n";
}

} // namespace

int main() {
    std::error_code ec;
    fs::remove_all(kOutDir, ec);

    test_state_machine();
    test_run_ids();
    test_command_helpers();
    test_command_processes();
    test_full_run();
    test_policy_stops();
    test_modes_and_actions();
    test_failure_isolation();
    test_triage_order();
    test_triage_failure_neutral();
    test_cancel_and_invalid();

    fs::remove_all(kOutDir, ec);
    std::cout << "[TEST] pipeline: all passed\n";
    return 0;
}
