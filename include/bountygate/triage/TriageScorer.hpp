#pragma once

#include <string>

#include "bountygate/core/Types.hpp"

namespace bountygate {

class AdvisoryService;
class Logger;
class TriageModel;

struct TriageWeights {
    double ml = 0.4;
    double llm = 0.6;
};

struct TriageResult {
    double ml_score = 0.5;
    double llm_score = 0.5;
    double final_score = 0.5;
    double confidence = 0.0;
    bool is_false_positive = false;
    std::string severity_adjusted;
    std::string explanation;
    bool advisory_ok = false;
};

constexpr double kFalsePositiveScore = 0.3;
constexpr double kDowngradeScore = 0.5;
constexpr double kUpgradeScore = 0.8;

double fuse_scores(double ml_score, double llm_score, const TriageWeights& w);

// <0.3 info; [0.3,0.5) high/critical -> medium; >0.8 medium -> high.
// Otherwise the (lower-cased) original severity.
std::string adjust_severity(const std::string& severity, double final_score);

// ---------------------------------------------------------------------------
// TriageScorer - fuses the local classifier with the advisory score.
// A missing or failing advisory contributes the neutral 0.5 with
// confidence 0.0. Scoring reads only the reported fields of a finding, so
// re-scoring is idempotent.
// ---------------------------------------------------------------------------
class TriageScorer {
public:
    // `advisory` may be null.
    TriageScorer(const TriageModel& model, AdvisoryService* advisory,
                 TriageWeights weights, Logger& log);

    TriageResult score(const FindingRecord& finding);

    // Neutral scores with the finding's own severity, for findings that
    // could not be scored.
    static TriageResult neutral(const FindingRecord& finding, std::string explanation);

    // Copies the result into the finding's triage fields.
    static void apply(const TriageResult& result, FindingRecord& finding);

private:
    const TriageModel& model_;
    AdvisoryService* advisory_;
    TriageWeights weights_;
    Logger& log_;
};

} // namespace bountygate
