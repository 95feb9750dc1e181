#include "bountygate/triage/TriageModel.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include "bountygate/triage/TextFeatures.hpp"

namespace bountygate {

double sigmoid(double z) {
    if (z >= 0.0) {
        const double e = std::exp(-z);
        return 1.0 / (1.0 + e);
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

TriageModel::TriageModel(std::vector<std::string> vocabulary, std::vector<double> idf,
                         std::vector<double> weights, double bias)
    : vocabulary_(std::move(vocabulary)),
      idf_(std::move(idf)),
      weights_(std::move(weights)),
      bias_(bias)
{
    if (idf_.size() != vocabulary_.size() || weights_.size() != vocabulary_.size()) {
        throw std::invalid_argument("triage model: vocabulary, idf and weights differ in length");
    }
    for (size_t i = 0; i < vocabulary_.size(); ++i) {
        if (!index_.emplace(vocabulary_[i], i).second) {
            throw std::invalid_argument("triage model: duplicate term '" + vocabulary_[i] + "'");
        }
    }
}

std::vector<double> TriageModel::vectorize(const std::string& text) const {
    std::vector<double> x(vocabulary_.size(), 0.0);
    for (const auto& term : ngram_terms(tokenize(text))) {
        auto it = index_.find(term);
        if (it != index_.end()) x[it->second] += 1.0;
    }

    double norm = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] *= idf_[i];
        norm += x[i] * x[i];
    }
    if (norm > 0.0) {
        norm = std::sqrt(norm);
        for (auto& v : x) v /= norm;
    }
    return x;
}

double TriageModel::predict(const std::string& text) const {
    if (!trained()) return kNeutral;

    const auto x = vectorize(text);
    double z = bias_;
    for (size_t i = 0; i < x.size(); ++i) z += weights_[i] * x[i];
    return sigmoid(z);
}

nlohmann::json TriageModel::to_json() const {
    return nlohmann::json{
        {"format", kFormat},
        {"vocabulary", vocabulary_},
        {"idf", idf_},
        {"weights", weights_},
        {"bias", bias_}
    };
}

TriageModel TriageModel::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("triage model: document is not an object");
    }
    if (j.value("format", std::string()) != kFormat) {
        throw std::invalid_argument("triage model: unsupported format");
    }
    try {
        return TriageModel(j.at("vocabulary").get<std::vector<std::string>>(),
                           j.at("idf").get<std::vector<double>>(),
                           j.at("weights").get<std::vector<double>>(),
                           j.at("bias").get<double>());
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("triage model: ") + e.what());
    }
}

TriageModel TriageModel::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open triage model: " + path);
    }
    const auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("triage model is not valid JSON: " + path);
    }
    try {
        return from_json(j);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string(e.what()) + " (" + path + ")");
    }
}

bool TriageModel::save_file(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) return false;
    out << to_json().dump(2) << "\n";
    return static_cast<bool>(out);
}

} // namespace bountygate
