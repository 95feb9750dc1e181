#pragma once

#include <string>

#include "bountygate/pipeline/Collaborators.hpp"
#include "bountygate/report/ReportPolicy.hpp"

namespace bountygate {

class Logger;

// ---------------------------------------------------------------------------
// Writes <output_dir>/<run_id>/report.json:
//
//   {
//     "run_id": "...", "target": "...", "generated_at": <epoch ms>,
//     "summary": {"total": n, "reportable": n, "false_positives": n,
//                 "min_report_score": x, "severity_counts": {"high": n, ...}},
//     "findings": [ reportable findings, input order ]
//   }
//
// severity_counts tallies severity_adjusted over every finding.
// ---------------------------------------------------------------------------
class JsonReportWriter : public Reporter {
public:
    JsonReportWriter(std::string output_dir, ReportPolicy policy, Logger& log);

    std::optional<std::string> publish(const std::string& run_id,
                                       const std::string& target,
                                       const std::vector<FindingRecord>& findings) override;

    nlohmann::json build(const std::string& run_id,
                         const std::string& target,
                         const std::vector<FindingRecord>& findings) const;

private:
    std::string output_dir_;
    ReportPolicy policy_;
    Logger& log_;
};

} // namespace bountygate
