#pragma once
#include <algorithm>
#include "term_coder/patch/PatchTypes.hpp"

namespace term_coder {

// Coarse risk estimate in [0.2, 1.0] from change scope and magnitude.
// A no-op scores exactly 1.0; even a huge change never reaches 0.
class SafetyScorer {
public:
    explicit SafetyScorer(SafetyThresholds thresholds = {}) : thresholds_(thresholds) {}

    double score(const ImpactAssessment& impact) const {
        return score(impact, thresholds_);
    }

    static double score(const ImpactAssessment& impact, const SafetyThresholds& t) {
        double file_factor = std::max(0.0, 1.0 - static_cast<double>(impact.files_changed) / std::max(1, t.max_files));
        double line_total = static_cast<double>(impact.lines_added) + static_cast<double>(impact.lines_removed);
        double line_factor = std::max(0.0, 1.0 - line_total / std::max(1, t.max_lines));
        double raw = 0.5 * file_factor + 0.5 * line_factor;
        return std::max(0.0, std::min(1.0, 0.2 + 0.8 * raw));
    }

    const SafetyThresholds& thresholds() const { return thresholds_; }

private:
    SafetyThresholds thresholds_;
};

}
