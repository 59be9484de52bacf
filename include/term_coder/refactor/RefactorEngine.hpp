#pragma once
#include <string>
#include <vector>
#include <functional>
#include <filesystem>
#include "term_coder/refactor/RefactorTypes.hpp"
#include "term_coder/patch/PatchSystem.hpp"

namespace term_coder::refactor {

using TestRunnerFn = std::function<TestCounts()>;

class RefactorEngine {
public:
    explicit RefactorEngine(const PatchSystem& patches);

    static const std::vector<std::string>& default_include_globs();

    // Token-exact rename across every matching source file. Empty globs mean
    // the defaults. max_files <= 0 takes refactor.max_files from the config.
    RefactorPlan rename_symbol(const std::string& old_name,
                               const std::string& new_name,
                               std::vector<std::string> include_globs = {},
                               std::vector<std::string> exclude_globs = {},
                               int max_files = 0) const;

    // Applies the plan (creating files is allowed), then runs tests and rolls
    // back when any fail. Without `test_runner` the project's TestRunner is used.
    ValidationResult apply_and_validate(const RefactorPlan& plan,
                                        bool run_tests = true,
                                        const TestRunnerFn& test_runner = nullptr) const;

private:
    const PatchSystem& patches_;
};

}
