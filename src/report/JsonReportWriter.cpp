#include "bountygate/report/JsonReportWriter.hpp"

#include <filesystem>
#include <fstream>

#include "bountygate/infra/Logger.hpp"
#include "bountygate/infra/Sanitizer.hpp"

namespace bountygate {

JsonReportWriter::JsonReportWriter(std::string output_dir, ReportPolicy policy, Logger& log)
    : output_dir_(std::move(output_dir)),
      policy_(policy),
      log_(log) {}

nlohmann::json JsonReportWriter::build(const std::string& run_id,
                                       const std::string& target,
                                       const std::vector<FindingRecord>& findings) const {
    nlohmann::json severity_counts = nlohmann::json::object();
    nlohmann::json reported = nlohmann::json::array();
    size_t false_positives = 0;

    for (const auto& f : findings) {
        const std::string sev = f.severity_adjusted.empty() ? f.severity : f.severity_adjusted;
        const std::string key = sev.empty() ? std::string("unknown") : sev;
        severity_counts[key] = severity_counts.value(key, 0) + 1;

        if (f.is_false_positive) ++false_positives;
        if (policy_.reportable(f)) reported.push_back(to_json(f));
    }

    return nlohmann::json{
        {"run_id", run_id},
        {"target", target},
        {"generated_at", wall_clock_ms()},
        {"summary", {
            {"total", findings.size()},
            {"reportable", reported.size()},
            {"false_positives", false_positives},
            {"min_report_score", policy_.min_score},
            {"severity_counts", severity_counts}
        }},
        {"findings", reported}
    };
}

std::optional<std::string> JsonReportWriter::publish(const std::string& run_id,
                                                     const std::string& target,
                                                     const std::vector<FindingRecord>& findings) {
    const std::filesystem::path dir = std::filesystem::path(output_dir_) / sanitize_filename(run_id);

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        log_.error("REPORT", "cannot create " + dir.string() + ": " + ec.message());
        return std::nullopt;
    }

    const std::filesystem::path path = dir / "report.json";
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        log_.error("REPORT", "cannot write " + path.string());
        return std::nullopt;
    }

    const nlohmann::json doc = build(run_id, target, findings);
    out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    if (!out) {
        log_.error("REPORT", "write failed for " + path.string());
        return std::nullopt;
    }

    log_.info("REPORT", "report written: " + path.string() + " (" +
                        std::to_string(doc["summary"]["reportable"].get<size_t>()) + " reportable)");
    return path.string();
}

} // namespace bountygate
