#pragma once
#include <string>
#include <vector>
#include "term_coder/patch/PatchTypes.hpp"

namespace term_coder {

struct DiffAnalysis {
    std::vector<std::string> affected_files;
    ImpactAssessment impact;
};

// Recovers touched files and +/- line counts from unified diff text, e.g. a
// diff returned by a model without an accompanying content map.
class DiffAnalyzer {
public:
    static DiffAnalysis analyze(const std::string& diff_text);
};

}
