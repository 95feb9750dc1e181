#include "bountygate/triage/ModelTrainer.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "bountygate/triage/TextFeatures.hpp"

namespace bountygate {

std::vector<LabeledExample> load_labeled_examples(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open training data: " + path);
    }
    const auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw std::runtime_error("training data must be a JSON array: " + path);
    }

    std::vector<LabeledExample> out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const auto& e = j[i];
        if (!e.is_object()) {
            throw std::runtime_error("training example " + std::to_string(i) + " is not an object");
        }
        const auto label = e.find("label");
        if (label == e.end() || !label->is_number_integer() ||
            (label->get<int>() != 0 && label->get<int>() != 1)) {
            throw std::runtime_error("training example " + std::to_string(i) + " needs label 0 or 1");
        }

        FindingRecord f;
        f.name = e.value("name", std::string());
        f.description = e.value("description", std::string());
        f.severity = e.value("severity", std::string());
        f.evidence = e.contains("evidence") ? e.at("evidence") : nlohmann::json::object();

        out.push_back(LabeledExample{finding_text(f), label->get<int>()});
    }
    return out;
}

ModelTrainer::ModelTrainer(TrainerOptions opts)
    : opts_(opts) {
    if (opts_.holdout_every < 2) opts_.holdout_every = 2;
}

TriageModel ModelTrainer::fit(const std::vector<LabeledExample>& examples) const {
    size_t positives = 0;
    for (const auto& ex : examples) positives += (ex.label == 1) ? 1 : 0;
    const size_t n = examples.size();
    if (positives == 0 || positives == n) {
        throw std::invalid_argument("training needs both true and false positive examples");
    }

    // ---------------------------------------------------------------------
    // Vocabulary by document frequency
    // ---------------------------------------------------------------------
    std::vector<std::vector<std::string>> docs;
    docs.reserve(n);
    std::map<std::string, size_t> df;
    for (const auto& ex : examples) {
        docs.push_back(ngram_terms(tokenize(ex.text)));
        std::set<std::string> unique(docs.back().begin(), docs.back().end());
        for (const auto& t : unique) ++df[t];
    }

    std::vector<std::pair<std::string, size_t>> ranked(df.begin(), df.end());
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > opts_.max_features) ranked.resize(opts_.max_features);
    // Column order is alphabetical, matching the sorted map.
    std::sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> vocab;
    std::vector<double> idf;
    for (const auto& [term, count] : ranked) {
        vocab.push_back(term);
        idf.push_back(std::log((1.0 + n) / (1.0 + count)) + 1.0);
    }

    // Zero weights give a model whose vectorize() we can reuse.
    TriageModel shell(vocab, idf, std::vector<double>(vocab.size(), 0.0), 0.0);
    std::vector<std::vector<double>> X;
    X.reserve(n);
    for (const auto& ex : examples) X.push_back(shell.vectorize(ex.text));

    // ---------------------------------------------------------------------
    // Class-balanced logistic regression
    // ---------------------------------------------------------------------
    const double w_pos = static_cast<double>(n) / (2.0 * positives);
    const double w_neg = static_cast<double>(n) / (2.0 * (n - positives));
    const size_t d = vocab.size();

    std::vector<double> w(d, 0.0);
    double b = 0.0;
    std::vector<double> grad(d);

    for (int it = 0; it < opts_.iterations; ++it) {
        std::fill(grad.begin(), grad.end(), 0.0);
        double grad_b = 0.0;

        for (size_t i = 0; i < n; ++i) {
            double z = b;
            for (size_t k = 0; k < d; ++k) z += w[k] * X[i][k];
            const double y = static_cast<double>(examples[i].label);
            const double sw = examples[i].label == 1 ? w_pos : w_neg;
            const double err = sw * (sigmoid(z) - y);
            for (size_t k = 0; k < d; ++k) grad[k] += err * X[i][k];
            grad_b += err;
        }

        for (size_t k = 0; k < d; ++k) {
            const double g = grad[k] / n + (opts_.l2 / n) * w[k];
            w[k] -= opts_.learning_rate * g;
        }
        b -= opts_.learning_rate * (grad_b / n);
    }

    return TriageModel(std::move(vocab), std::move(idf), std::move(w), b);
}

double ModelTrainer::accuracy(const TriageModel& model, const std::vector<LabeledExample>& examples) {
    if (examples.empty()) return 0.0;
    size_t correct = 0;
    for (const auto& ex : examples) {
        const int predicted = model.predict(ex.text) >= 0.5 ? 1 : 0;
        if (predicted == ex.label) ++correct;
    }
    return static_cast<double>(correct) / examples.size();
}

TriageModel ModelTrainer::train(const std::vector<LabeledExample>& examples,
                                TrainingReport& report) const {
    std::vector<LabeledExample> train_set;
    std::vector<LabeledExample> test_set;

    size_t seen[2] = {0, 0};
    for (const auto& ex : examples) {
        const size_t k = ++seen[ex.label == 1 ? 1 : 0];
        if (k % opts_.holdout_every == 0) {
            test_set.push_back(ex);
        } else {
            train_set.push_back(ex);
        }
    }

    TriageModel model = fit(train_set);

    report.train_size = train_set.size();
    report.test_size = test_set.size();
    report.features = model.feature_count();
    report.train_accuracy = accuracy(model, train_set);
    report.test_accuracy = accuracy(model, test_set);
    return model;
}

} // namespace bountygate
