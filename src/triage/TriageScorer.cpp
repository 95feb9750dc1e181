#include "bountygate/triage/TriageScorer.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

#include "bountygate/advisory/AdvisoryService.hpp"
#include "bountygate/infra/Logger.hpp"
#include "bountygate/triage/TextFeatures.hpp"
#include "bountygate/triage/TriageModel.hpp"

namespace bountygate {

double fuse_scores(double ml_score, double llm_score, const TriageWeights& w) {
    return w.ml * ml_score + w.llm * llm_score;
}

std::string adjust_severity(const std::string& severity, double final_score) {
    std::string sev = severity.empty() ? std::string("unknown") : severity;
    for (auto& c : sev) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (final_score < kFalsePositiveScore) return "info";
    if (final_score < kDowngradeScore) {
        if (sev == "high" || sev == "critical") return "medium";
        return sev;
    }
    if (final_score > kUpgradeScore && sev == "medium") return "high";
    return sev;
}

TriageScorer::TriageScorer(const TriageModel& model, AdvisoryService* advisory,
                           TriageWeights weights, Logger& log)
    : model_(model),
      advisory_(advisory),
      weights_(weights),
      log_(log) {}

TriageResult TriageScorer::score(const FindingRecord& finding) {
    TriageResult r;
    r.ml_score = model_.predict(finding_text(finding));

    bool likely_fp = false;
    if (advisory_) {
        const FindingAdviceResult advice = advisory_->score_finding(finding);
        r.advisory_ok = advice.ok;
        r.llm_score = advice.advice.score;
        r.confidence = advice.advice.confidence;
        r.explanation = advice.advice.explanation;
        likely_fp = advice.ok && advice.advice.is_likely_fp;
    } else {
        r.llm_score = 0.5;
        r.confidence = 0.0;
        r.explanation = "Advisory scoring disabled";
    }

    r.final_score = fuse_scores(r.ml_score, r.llm_score, weights_);
    r.is_false_positive = likely_fp || r.final_score < kFalsePositiveScore;
    r.severity_adjusted = adjust_severity(finding.severity, r.final_score);

    char buf[160];
    std::snprintf(buf, sizeof(buf), " ml=%.3f llm=%.3f final=%.3f%s",
                  r.ml_score, r.llm_score, r.final_score, r.is_false_positive ? " (fp)" : "");
    log_.info("TRIAGE", (finding.name.empty() ? std::string("Unknown") : finding.name) + buf);
    return r;
}

TriageResult TriageScorer::neutral(const FindingRecord& finding, std::string explanation) {
    TriageResult r;
    r.severity_adjusted = adjust_severity(finding.severity, r.final_score);
    r.explanation = std::move(explanation);
    return r;
}

void TriageScorer::apply(const TriageResult& result, FindingRecord& finding) {
    finding.ml_score = result.ml_score;
    finding.llm_score = result.llm_score;
    finding.final_score = result.final_score;
    finding.confidence = result.confidence;
    finding.is_false_positive = result.is_false_positive;
    finding.severity_adjusted = result.severity_adjusted;
    finding.explanation = result.explanation;
}

} // namespace bountygate
