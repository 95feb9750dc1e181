#pragma once

#include <string>
#include <vector>

#include "bountygate/triage/TriageModel.hpp"

namespace bountygate {

struct LabeledExample {
    std::string text;
    int label = 0;  // 1 = true positive, 0 = false positive
};

struct TrainerOptions {
    size_t max_features = 100;
    int iterations = 1000;
    double learning_rate = 0.5;
    double l2 = 1.0;           // inverse of sklearn's C, applied per example
    size_t holdout_every = 5;  // every 5th example per class goes to the test split
};

struct TrainingReport {
    size_t train_size = 0;
    size_t test_size = 0;
    size_t features = 0;
    double train_accuracy = 0.0;
    double test_accuracy = 0.0;
};

// Reads [{name, description, severity, evidence, label}, ...].
// Throws std::runtime_error on unreadable files or malformed entries.
std::vector<LabeledExample> load_labeled_examples(const std::string& path);

// ---------------------------------------------------------------------------
// Offline trainer. Deterministic: same examples and options give the same
// model bit for bit.
//   1. stratified split (holdout_every-th example of each class held out)
//   2. vocabulary: top max_features unigram/bigram terms by document
//      frequency on the training split, ties broken alphabetically
//   3. smooth idf = ln((1 + n) / (1 + df)) + 1
//   4. class-balanced logistic regression by batch gradient descent
// ---------------------------------------------------------------------------
class ModelTrainer {
public:
    explicit ModelTrainer(TrainerOptions opts = {});

    // Throws std::invalid_argument unless both classes are present.
    TriageModel fit(const std::vector<LabeledExample>& examples) const;

    // Split, fit on the training part, evaluate on both parts.
    TriageModel train(const std::vector<LabeledExample>& examples, TrainingReport& report) const;

    static double accuracy(const TriageModel& model, const std::vector<LabeledExample>& examples);

private:
    TrainerOptions opts_;
};

} // namespace bountygate
