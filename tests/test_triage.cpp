// Score fusion, severity adjustment, the TF-IDF model and its trainer.

#include "TestSupport.hpp"

#include <cstdio>
#include <fstream>

#include "bountygate/advisory/AdvisoryService.hpp"
#include "bountygate/triage/ModelTrainer.hpp"
#include "bountygate/triage/TextFeatures.hpp"
#include "bountygate/triage/TriageModel.hpp"
#include "bountygate/triage/TriageScorer.hpp"

using namespace bgtest;

namespace {

std::vector<LabeledExample> corpus() {
    std::vector<LabeledExample> out;
    const char* tp[] = {
        "sql injection error based payload confirmed database error",
        "reflected xss payload executed in response body script",
        "sql injection time based payload confirmed delay",
        "stored xss payload executed for admin script",
        "remote file read confirmed payload etc passwd",
        "sql injection union payload confirmed columns",
    };
    const char* fp[] = {
        "missing security header informational no impact",
        "server banner version disclosure informational",
        "missing header x frame options informational",
        "cookie without secure flag informational static asset",
        "missing security header on redirect informational",
        "version disclosure in banner informational no impact",
    };
    for (const char* t : tp) out.push_back({t, 1});
    for (const char* t : fp) out.push_back({t, 0});
    return out;
}

void test_fusion() {
    const TriageWeights w{0.4, 0.6};
    assert(near(fuse_scores(0.8, 0.4, w), 0.56));
    assert(near(fuse_scores(0.5, 0.5, w), 0.5));
    assert(near(fuse_scores(1.0, 0.0, TriageWeights{1.0, 0.0}), 1.0));
    std::cout << "[TEST] fusion ok\n";
}

void test_severity() {
    assert(adjust_severity("high", 0.2999) == "info");
    assert(adjust_severity("high", 0.3) != "info");
    assert(adjust_severity("high", 0.3) == "medium");
    assert(adjust_severity("CRITICAL", 0.45) == "medium");
    assert(adjust_severity("low", 0.45) == "low");
    assert(adjust_severity("medium", 0.81) == "high");
    assert(adjust_severity("medium", 0.8) == "medium");
    assert(adjust_severity("High", 0.9) == "high");
    assert(adjust_severity("", 0.6) == "unknown");
    std::cout << "[TEST] severity ok\n";
}

void test_features() {
    auto toks = tokenize("SQL-Injection: a b_c 42!");
    assert(toks.size() == 4);
    assert(toks[0] == "sql" && toks[1] == "injection" && toks[2] == "b_c" && toks[3] == "42");

    auto terms = ngram_terms({"sql", "injection", "found"});
    assert(terms.size() == 5);
    assert(terms[3] == "sql injection");
    assert(terms[4] == "injection found");

    FindingRecord f;
    f.name = "XSS";
    f.final_score = 0.9;
    f.explanation = "should not leak into features";
    assert(finding_text(f).find("leak") == std::string::npos);
    std::cout << "[TEST] features ok\n";
}

void test_untrained_model() {
    TriageModel m;
    assert(!m.trained());
    assert(near(m.predict("anything at all"), TriageModel::kNeutral));
    assert(near(sigmoid(0.0), 0.5));

    bool threw = false;
    try {
        TriageModel bad({"a", "b"}, {1.0}, {0.0, 0.0}, 0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        TriageModel::from_json(nlohmann::json{{"format", "other"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        TriageModel::load_file("no/such/model.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[TEST] untrained model ok\n";
}

void test_vectorize() {
    TriageModel m({"injection", "sql", "sql injection"}, {1.0, 2.0, 1.5}, {0.0, 0.0, 0.0}, 0.0);
    auto v = m.vectorize("SQL injection");
    double norm = 0.0;
    for (double x : v) norm += x * x;
    assert(near(norm, 1.0, 1e-9));
    assert(v[1] > v[0]);

    auto empty = m.vectorize("nothing relevant");
    for (double x : empty) assert(x == 0.0);
    std::cout << "[TEST] vectorize ok\n";
}

void test_trainer() {
    const auto data = corpus();
    ModelTrainer trainer(TrainerOptions{50, 500, 0.5, 1.0, 5});

    TriageModel a = trainer.fit(data);
    TriageModel b = trainer.fit(data);
    assert(a.trained());
    assert(a.feature_count() <= 50);
    assert(a.vocabulary() == b.vocabulary());
    assert(a.weights() == b.weights());
    assert(a.bias() == b.bias());

    assert(a.predict("sql injection payload confirmed") > 0.5);
    assert(a.predict("missing header informational") < 0.5);
    assert(ModelTrainer::accuracy(a, data) >= 0.9);

    TrainingReport report;
    TriageModel held = trainer.train(data, report);
    assert(report.test_size == 2);  // 5th example of each class
    assert(report.train_size == 10);
    assert(report.features == held.feature_count());

    std::vector<LabeledExample> one_class = {{"x y", 1}, {"y z", 1}};
    bool threw = false;
    try {
        trainer.fit(one_class);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // persisted model predicts identically
    const std::string path = "bountygate_test_model.json";
    assert(a.save_file(path));
    TriageModel loaded = TriageModel::load_file(path);
    std::remove(path.c_str());
    assert(loaded.vocabulary() == a.vocabulary());
    assert(near(loaded.predict("sql injection payload"), a.predict("sql injection payload"), 1e-12));
    std::cout << "[TEST] trainer ok\n";
}

void test_labeled_file() {
    const std::string path = "bountygate_test_labeled.json";
    {
        std::ofstream out(path);
        out << R"([{"name": "SQLi", "description": "error based", "severity": "high",
                    "evidence": {"param": "id"}, "label": 1},
                   {"name": "Header", "severity": "info", "label": 0}])";
    }
    auto ex = load_labeled_examples(path);
    assert(ex.size() == 2);
    assert(ex[0].label == 1 && ex[0].text.find("SQLi") != std::string::npos);

    {
        std::ofstream out(path);
        out << R"([{"name": "x", "label": 2}])";
    }
    bool threw = false;
    try {
        load_labeled_examples(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::remove(path.c_str());
    std::cout << "[TEST] labeled file ok\n";
}

void test_scorer() {
    QuietLog q;
    TriageModel untrained;

    // no advisory: neutral llm score
    TriageScorer local(untrained, nullptr, TriageWeights{0.4, 0.6}, q.log);
    FindingRecord f;
    f.name = "Missing header";
    f.severity = "High";
    TriageResult r = local.score(f);
    assert(near(r.ml_score, 0.5) && near(r.llm_score, 0.5) && near(r.final_score, 0.5));
    assert(near(r.confidence, 0.0));
    assert(!r.is_false_positive);
    assert(r.severity_adjusted == "high");

    // advisory present and answering
    MemoryStorage store;
    FakeTransport model;
    AdvisoryService svc(model, q.log, &store, false);
    TriageScorer fused(untrained, &svc, TriageWeights{0.4, 0.6}, q.log);

    model.push(AdvisoryReply::success(R"({"score": 0.9, "confidence": 0.7, "explanation": "real"})"));
    r = fused.score(f);
    assert(r.advisory_ok);
    assert(near(r.final_score, 0.4 * 0.5 + 0.6 * 0.9));
    assert(!r.is_false_positive);

    // likely false positive flag from a valid reply wins over the score
    model.push(AdvisoryReply::success(R"({"score": 0.9, "is_likely_fp": true})"));
    assert(fused.score(f).is_false_positive);

    // low fused score is a false positive on its own
    model.push(AdvisoryReply::success(R"({"score": 0.0})"));
    r = fused.score(f);
    assert(near(r.final_score, 0.2));
    assert(r.is_false_positive);
    assert(r.severity_adjusted == "info");

    // advisory failure: neutral 0.5 and zero confidence
    model.push(AdvisoryReply::failure("HTTP 500"));
    r = fused.score(f);
    assert(!r.advisory_ok);
    assert(near(r.llm_score, 0.5));
    assert(near(r.confidence, 0.0));

    // re-scoring a scored finding is stable
    model.fallback = AdvisoryReply::success(R"({"score": 0.6, "confidence": 0.5})");
    FindingRecord g = f;
    TriageScorer::apply(fused.score(g), g);
    const double first = g.final_score;
    const std::string first_sev = g.severity_adjusted;
    TriageScorer::apply(fused.score(g), g);
    assert(near(g.final_score, first));
    assert(g.severity_adjusted == first_sev);
    std::cout << "[TEST] scorer ok\n";
}

} // namespace

int main() {
    test_fusion();
    test_severity();
    test_features();
    test_untrained_model();
    test_vectorize();
    test_trainer();
    test_labeled_file();
    test_scorer();
    std::cout << "[TEST] triage: all passed\n";
    return 0;
}
