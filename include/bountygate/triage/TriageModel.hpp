#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace bountygate {

// ---------------------------------------------------------------------------
// TriageModel - TF-IDF features into a logistic regression.
//
//   x_t    = count(t) * idf(t), then L2-normalised
//   p(TP)  = sigmoid(w . x + bias)
//
// An untrained model (no vocabulary) always predicts the neutral 0.5.
//
// Model file:
//   {"format": "bountygate-triage-v1",
//    "vocabulary": ["term", ...], "idf": [...], "weights": [...], "bias": b}
// ---------------------------------------------------------------------------
class TriageModel {
public:
    static constexpr const char* kFormat = "bountygate-triage-v1";
    static constexpr double kNeutral = 0.5;

    TriageModel() = default;
    TriageModel(std::vector<std::string> vocabulary, std::vector<double> idf,
                std::vector<double> weights, double bias);

    bool trained() const { return !vocabulary_.empty(); }
    size_t feature_count() const { return vocabulary_.size(); }

    // Probability that the text describes a true positive.
    double predict(const std::string& text) const;

    // L2-normalised TF-IDF vector over the model vocabulary.
    std::vector<double> vectorize(const std::string& text) const;

    nlohmann::json to_json() const;
    // Throws std::invalid_argument on a malformed document.
    static TriageModel from_json(const nlohmann::json& j);

    // Throws std::runtime_error when the file cannot be read or parsed.
    static TriageModel load_file(const std::string& path);
    bool save_file(const std::string& path) const;

    const std::vector<std::string>& vocabulary() const { return vocabulary_; }
    const std::vector<double>& weights() const { return weights_; }
    double bias() const { return bias_; }

private:
    std::vector<std::string> vocabulary_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<double> idf_;
    std::vector<double> weights_;
    double bias_ = 0.0;
};

double sigmoid(double z);

} // namespace bountygate
