#pragma once

#include <vector>

#include "bountygate/core/Types.hpp"

namespace bountygate {

// A finding is reported when it is not flagged as a false positive and its
// fused score is strictly above min_score. Severity plays no part.
struct ReportPolicy {
    double min_score = 0.5;

    bool reportable(const FindingRecord& f) const {
        return !f.is_false_positive && f.final_score > min_score;
    }

    // Keeps input order.
    std::vector<FindingRecord> select(const std::vector<FindingRecord>& findings) const {
        std::vector<FindingRecord> out;
        for (const auto& f : findings) {
            if (reportable(f)) out.push_back(f);
        }
        return out;
    }
};

} // namespace bountygate
