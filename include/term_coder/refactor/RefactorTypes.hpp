#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "term_coder/patch/PatchTypes.hpp"

namespace term_coder::refactor {

struct RefactorChange {
    std::string path;
    int replacements = 0;
    std::string strategy;  // "token" or "regex"
};

struct SafetyReport {
    int files_changed = 0;
    int total_replacements = 0;
    int max_files_allowed = 0;
    bool ok = false;
    std::vector<std::string> notes;
};

struct RefactorPlan {
    std::string template_name;
    std::string old_name;
    std::string new_name;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    ChangeSet changes;
    std::vector<RefactorChange> change_stats;
    SafetyReport safety;
    std::optional<PatchProposal> proposal;
};

// (failed, passed)
using TestCounts = std::pair<int, int>;

struct ValidationResult {
    bool applied = false;
    std::optional<std::string> backup_id;
    std::optional<TestCounts> test_result;
};

}
