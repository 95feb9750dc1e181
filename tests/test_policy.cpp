// Scope matching, rule manifest, policy gate, override and audit chain.

#include "TestSupport.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <thread>
#include <vector>

#include "bountygate/advisory/AdvisoryService.hpp"
#include "bountygate/infra/Config.hpp"
#include "bountygate/policy/AuditTrail.hpp"
#include "bountygate/policy/PolicyGate.hpp"
#include "bountygate/policy/RuleManifest.hpp"
#include "bountygate/policy/ScopeDefinition.hpp"
#include "bountygate/policy/ScopeMatcher.hpp"

using namespace bgtest;

namespace {

ScopeDefinition example_scope() {
    ScopeDefinition s;
    s.in_scope = {"*.example.com", "api.example.com"};
    s.out_of_scope = {"dev.example.com"};
    return s;
}

ActionDescriptor action_for(const std::string& tpl) {
    ActionDescriptor a;
    a.scanner_kind = "nuclei";
    a.target = "api.example.com";
    a.template_or_rule_id = tpl;
    a.severity_hint = "low,medium";
    return a;
}

void test_matcher() {
    // *.D covers D itself and hosts under it, never a suffix without a dot
    assert(matches("example.com", "*.example.com"));
    assert(matches("api.example.com", "*.example.com"));
    assert(matches("a.b.example.com", "*.example.com"));
    assert(!matches("badexample.com", "*.example.com"));
    assert(!matches("example.com.evil.net", "*.example.com"));

    // bare domain: strict subdomains only, plus exact equality
    assert(matches("example.com", "example.com"));
    assert(matches("www.example.com", "example.com"));
    assert(!matches("notexample.com", "example.com"));

    // case-insensitive, regex metacharacters are literal
    assert(matches("API.Example.COM", "api.example.com"));
    assert(!matches("apixexample.com", "api.example.com"));
    assert(!matches("", "example.com"));
    assert(!matches("example.com", ""));

    std::vector<std::string> pats = {"other.org", "*.example.com"};
    const std::string* hit = first_match("x.example.com", pats);
    assert(hit && *hit == "*.example.com");
    assert(first_match("x.test", pats) == nullptr);
    std::cout << "[TEST] matcher ok\n";
}

void test_scope_file() {
    const std::string path = "bountygate_test_scope.json";
    {
        std::ofstream out(path);
        out << R"({"in_scope": ["*.example.com"], "out_of_scope": ["dev.example.com"]})";
    }
    ScopeDefinition s = ScopeDefinition::load_file(path);
    assert(s.in_scope.size() == 1 && s.out_of_scope.size() == 1);

    {
        std::ofstream out(path);
        out << R"({"in_scope": [42]})";
    }
    bool threw = false;
    try {
        ScopeDefinition::load_file(path);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::remove(path.c_str());

    threw = false;
    try {
        ScopeDefinition::load_file("does/not/exist.json");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[TEST] scope file ok\n";
}

void test_manifest() {
    RuleManifest m = RuleManifest::defaults();
    assert(m.block_count() == 4);
    assert(m.validation_count() == 2);

    const BlockRule* b = m.first_block("rce-exploit-template");
    assert(b && b->id == "rce-templates");
    assert(m.first_block("sqlmap-run") && m.first_block("sqlmap-run")->id == "sql-exploit");
    assert(m.first_block("http-missing-security-headers") == nullptr);

    const ValidationRule* v = m.first_validation("auth-bypass-check");
    assert(v && v->id == "auth-bypass");
    assert(m.first_validation("LFI-probe") && m.first_validation("LFI-probe")->id == "file-inclusion");

    RuleManifest custom = RuleManifest::from_json_text(R"({
        "blocked_patterns": [{"id": "no-brute", "pattern": "brute", "notes": "brute force"}],
        "requires_validation": [{"id": "ssrf", "pattern": "ssrf"}]
    })");
    assert(custom.block_count() == 1 && custom.validation_count() == 1);
    assert(custom.first_block("ssh-BRUTE") && custom.first_block("ssh-BRUTE")->notes == "brute force");

    const char* bad[] = {
        "not json",
        R"({"blocked_patterns": [{"id": "a", "pattern": "("}]})",
        R"({"blocked_patterns": [{"id": "a", "pattern": "x"}, {"id": "a", "pattern": "y"}]})",
        R"({"blocked_patterns": [{"pattern": "x"}]})",
        R"({"blocked_patterns": [], "requires_validation": []})",
    };
    for (const char* text : bad) {
        bool threw = false;
        try {
            RuleManifest::from_json_text(text);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "[TEST] manifest ok\n";
}

void test_scope_decisions() {
    QuietLog q;
    MemoryStorage store;
    AuditTrail audit(q.log, &store);
    RuleManifest rules = RuleManifest::defaults();
    PolicyGate gate(rules, audit, q.log, nullptr);

    const std::optional<ScopeDefinition> scope = example_scope();

    // exclusion wins over a matching inclusion
    PolicyDecision dev = gate.validate_scope("dev.example.com", scope);
    assert(dev.decision == Decision::Blocked);
    assert(near(dev.confidence, 1.0));
    assert(dev.reason == "Target matches out-of-scope pattern: dev.example.com");

    PolicyDecision api = gate.validate_scope("api.example.com", scope);
    assert(api.decision == Decision::Allowed);
    assert(near(api.confidence, 1.0));

    PolicyDecision other = gate.validate_scope("other.org", scope);
    assert(other.decision == Decision::Unknown);
    assert(near(other.confidence, 0.0));

    PolicyDecision none = gate.validate_scope("api.example.com", std::nullopt);
    assert(none.decision == Decision::Unknown);
    assert(none.reason == "no scope provided");

    assert(store.decisions.size() == 4);
    for (const auto& r : store.decisions) assert(r.action_kind == "scope_check");
    assert(store.decisions[0].target == "dev.example.com");
    assert(store.decisions[0].decision == Decision::Blocked);
    std::cout << "[TEST] scope decisions ok\n";
}

void test_scope_advisory() {
    QuietLog q;
    MemoryStorage store;
    FakeTransport model;
    AdvisoryService advisory(model, q.log, &store, true);
    AuditTrail audit(q.log, &store);
    RuleManifest rules = RuleManifest::defaults();
    PolicyGate gate(rules, audit, q.log, &advisory);

    const std::optional<ScopeDefinition> scope = example_scope();

    // local rules settle it: no advisory call
    assert(gate.validate_scope("dev.example.com", scope).decision == Decision::Blocked);
    assert(gate.validate_scope("api.example.com", scope).decision == Decision::Allowed);
    assert(model.calls() == 0);

    model.push(AdvisoryReply::success(
        "```json\n{\"decision\": \"ALLOWED\", \"confidence\": 0.7, \"reasons\": [\"acquired brand\"]}\n```"));
    PolicyDecision d = gate.validate_scope("other.org", scope);
    assert(model.calls() == 1);
    assert(d.decision == Decision::Allowed);
    assert(near(d.confidence, 0.7));
    assert(store.decisions.back().action_kind == "scope_check_advisory");
    assert(store.exchanges.size() == 1);
    assert(store.exchanges[0].model == "fake-model");

    // transport failure: UNKNOWN, zero confidence
    model.push(AdvisoryReply::failure("HTTP 503"));
    d = gate.validate_scope("third.org", scope);
    assert(d.decision == Decision::Unknown);
    assert(near(d.confidence, 0.0));
    assert(d.reason.find("HTTP 503") != std::string::npos);

    // malformed payload: UNKNOWN as well
    model.push(AdvisoryReply::success("{\"decision\": \"MAYBE\"}"));
    d = gate.validate_scope("fourth.org", scope);
    assert(d.decision == Decision::Unknown);
    std::cout << "[TEST] scope advisory ok\n";
}

void test_action_decisions() {
    QuietLog q;
    MemoryStorage store;
    AuditTrail audit(q.log, &store);
    RuleManifest rules = RuleManifest::defaults();
    PolicyGate gate(rules, audit, q.log, nullptr);

    PolicyDecision rce = gate.validate_action(action_for("rce-exploit-template"));
    assert(rce.decision == Decision::Blocked);
    assert(near(rce.confidence, 1.0));
    assert(rce.reason.find("rce-templates") != std::string::npos);
    assert(store.decisions.back().action_kind == "scanner_nuclei");

    PolicyDecision auth = gate.validate_action(action_for("auth-bypass-check"));
    assert(auth.decision == Decision::RequiresValidation);
    assert(near(auth.confidence, 0.5));
    assert(auth.reason.find("auth-bypass") != std::string::npos);

    PolicyDecision plain = gate.validate_action(action_for("http-missing-security-headers"));
    assert(plain.decision == Decision::Allowed);
    assert(plain.reason == "No policy restrictions matched");

    // same input, same decision
    for (int i = 0; i < 5; ++i) {
        PolicyDecision again = gate.validate_action(action_for("rce-exploit-template"));
        assert(again.decision == rce.decision);
        assert(again.reason == rce.reason);
        assert(near(again.confidence, rce.confidence));
    }
    std::cout << "[TEST] action decisions ok\n";
}

void test_action_advisory() {
    QuietLog q;
    MemoryStorage store;
    FakeTransport model;
    AdvisoryService advisory(model, q.log, &store, false);
    AuditTrail audit(q.log, &store);
    RuleManifest rules = RuleManifest::defaults();
    PolicyGate gate(rules, audit, q.log, &advisory);

    // block rules never reach the advisory
    assert(gate.validate_action(action_for("rce-exploit-template")).decision == Decision::Blocked);
    assert(model.calls() == 0);

    // advisory failure on a validation rule is fail-closed
    model.push(AdvisoryReply::failure("timeout"));
    PolicyDecision d = gate.validate_action(action_for("auth-bypass-check"));
    assert(d.decision == Decision::Blocked);
    assert(near(d.confidence, 0.0));
    assert(store.decisions.back().action_kind == "scanner_nuclei_advisory");

    model.push(AdvisoryReply::success("no json here"));
    d = gate.validate_action(action_for("auth-bypass-check"));
    assert(d.decision == Decision::Blocked);
    assert(near(d.confidence, 0.0));

    model.push(AdvisoryReply::success(
        R"({"decision": "ALLOWED", "confidence": 0.9, "reasons": ["read-only"], "risk_level": "low"})"));
    d = gate.validate_action(action_for("auth-bypass-check"));
    assert(d.decision == Decision::Allowed);
    assert(d.details == "Risk level: low");

    // storing disabled
    assert(store.exchanges.empty());
    std::cout << "[TEST] action advisory ok\n";
}

void test_override() {
    QuietLog q;
    MemoryStorage store;
    AuditTrail audit(q.log, &store);
    RuleManifest rules = RuleManifest::defaults();
    PolicyGate gate(rules, audit, q.log, nullptr);

    ScriptedOverrideChannel yes(std::string("I_ACCEPT_RISK"));
    assert(gate.confirm_override("other.org", yes));
    assert(yes.prompts.size() == 1);
    assert(yes.prompts[0].find("I_ACCEPT_RISK") != std::string::npos);
    assert(store.decisions.back().action_kind == "manual_override");
    assert(store.decisions.back().decision == Decision::Allowed);

    ScriptedOverrideChannel lower(std::string("i_accept_risk"));
    assert(!gate.confirm_override("other.org", lower));
    assert(store.decisions.back().decision == Decision::Blocked);

    ScriptedOverrideChannel eof(std::nullopt);
    assert(!gate.confirm_override("other.org", eof));

    std::istringstream in("  I_ACCEPT_RISK\nI_ACCEPT_RISK\r\n");
    std::ostringstream out;
    ConsoleOverrideChannel console(in, out);
    assert(!gate.confirm_override("other.org", console));  // leading spaces
    assert(gate.confirm_override("other.org", console));   // CRLF tolerated
    assert(!out.str().empty());
    std::cout << "[TEST] override ok\n";
}

void test_audit_chain() {
    QuietLog q;
    MemoryStorage store;
    AuditTrail audit(q.log, &store);

    PolicyDecision d;
    d.decision = Decision::Allowed;
    d.confidence = 1.0;
    d.reason = "r1";
    audit.append("a.example.com", "scope_check", d);
    d.decision = Decision::Blocked;
    d.reason = "r2";
    audit.append("b.example.com", "scanner_nuclei", d);

    auto recs = audit.records();
    assert(recs.size() == 2);
    assert(recs[0].digest.size() == 64);
    assert(recs[0].digest != recs[1].digest);
    assert(audit.head_digest() == recs[1].digest);
    assert(AuditTrail::verify_chain(recs));
    assert(store.decisions.size() == 2);
    assert(store.decisions[1].digest == recs[1].digest);

    auto tampered = recs;
    tampered[0].reason = "edited";
    assert(!AuditTrail::verify_chain(tampered));

    // the log line carries the persisted decision spelling
    assert(q.sink.str().find("BLOCKED") != std::string::npos);

    // a failing store does not lose the record
    store.fail_writes = true;
    AuditRecord kept = audit.append("c.example.com", "scope_check", d);
    assert(audit.records().size() == 3);
    assert(kept.digest == audit.head_digest());
    assert(AuditTrail::verify_chain(audit.records()));
    std::cout << "[TEST] audit chain ok\n";
}

// Reads the trail back from inside the storage write.
struct ReadBackStorage : MemoryStorage {
    AuditTrail* trail = nullptr;
    std::atomic<int> reads{0};

    bool append_policy_decision(const AuditRecord& record) override {
        if (trail && !trail->head_digest().empty()) ++reads;
        return MemoryStorage::append_policy_decision(record);
    }
};

void test_audit_persist_order() {
    QuietLog q;
    ReadBackStorage store;
    AuditTrail audit(q.log, &store);
    store.trail = &audit;

    PolicyDecision d;
    d.decision = Decision::Allowed;
    d.confidence = 1.0;
    d.reason = "concurrent";

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&audit, d, t]() {
            for (int i = 0; i < 50; ++i) {
                audit.append("host" + std::to_string(t) + ".example.com", "scope_check", d);
            }
        });
    }
    for (auto& w : workers) w.join();

    // every write saw the trail unlocked, and storage order is chain order
    assert(store.reads.load() == 200);
    assert(store.decisions.size() == 200);
    assert(AuditTrail::verify_chain(store.decisions));
    assert(store.decisions.back().digest == audit.head_digest());
    std::cout << "[TEST] audit persist order ok\n";
}

void test_audit_recent_bound() {
    QuietLog q;
    AuditTrail audit(q.log, nullptr);

    PolicyDecision d;
    d.decision = Decision::Blocked;
    d.confidence = 1.0;
    d.reason = "bounded";
    for (size_t i = 0; i < AuditTrail::kRecentRecords + 44; ++i) {
        audit.append("a.example.com", "scanner_nuclei", d);
    }

    const auto recent = audit.records();
    assert(recent.size() == AuditTrail::kRecentRecords);
    assert(!audit.tail_seed().empty());
    assert(AuditTrail::verify_chain(recent, audit.tail_seed()));
    assert(!AuditTrail::verify_chain(recent));
    assert(recent.back().digest == audit.head_digest());
    std::cout << "[TEST] audit recent bound ok\n";
}

} // namespace

int main() {
    test_matcher();
    test_scope_file();
    test_manifest();
    test_scope_decisions();
    test_scope_advisory();
    test_action_decisions();
    test_action_advisory();
    test_override();
    test_audit_chain();
    test_audit_persist_order();
    test_audit_recent_bound();
    std::cout << "[TEST] policy: all passed\n";
    return 0;
}
