#include "term_coder/refactor/RefactorEngine.hpp"
#include "term_coder/refactor/Renamer.hpp"
#include "term_coder/validation/TestRunner.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include <spdlog/spdlog.h>

namespace term_coder::refactor {

namespace fs = std::filesystem;

RefactorEngine::RefactorEngine(const PatchSystem& patches) : patches_(patches) {}

const std::vector<std::string>& RefactorEngine::default_include_globs() {
    static const std::vector<std::string> globs = {
        "**/*.py", "*.py",
        "**/*.c", "*.c", "**/*.h", "*.h",
        "**/*.cc", "*.cc", "**/*.cpp", "*.cpp", "**/*.cxx", "*.cxx",
        "**/*.hpp", "*.hpp", "**/*.hh", "*.hh"
    };
    return globs;
}

RefactorPlan RefactorEngine::rename_symbol(const std::string& old_name,
                                           const std::string& new_name,
                                           std::vector<std::string> include_globs,
                                           std::vector<std::string> exclude_globs,
                                           int max_files) const {
    if (include_globs.empty()) include_globs = default_include_globs();
    if (max_files <= 0) max_files = patches_.config().refactor_max_files;

    RefactorPlan plan;
    plan.template_name = "rename_symbol";
    plan.old_name = old_name;
    plan.new_name = new_name;
    plan.include = include_globs;
    plan.exclude = exclude_globs;
    plan.safety.max_files_allowed = max_files;

    if (!is_valid_identifier(old_name) || !is_valid_identifier(new_name)) {
        plan.safety.notes.push_back("Invalid identifier: '" + old_name + "' -> '" + new_name + "'.");
        spdlog::warn("🛑 Rename refused, not an identifier: '{}' -> '{}'", old_name, new_name);
        return plan;
    }

    TokenAwareRenamer token_renamer;
    RegexFallbackRenamer regex_renamer;
    const fs::path& root = patches_.root();

    for (const auto& rel : FileSystemTools::iter_source_files(root, include_globs, exclude_globs)) {
        fs::path abs = root / rel;
        if (!FileSystemTools::is_text_file(abs)) continue;
        auto text = FileSystemTools::read_file(abs);
        if (!text) continue;

        std::string ext = fs::path(rel).extension().string();
        Renamer* used = &token_renamer;
        auto outcome = token_renamer.rename(*text, ext, old_name, new_name);
        if (!outcome) {
            spdlog::debug("🔤 {} not tokenizable, using whole-word replace", rel);
            used = &regex_renamer;
            outcome = regex_renamer.rename(*text, ext, old_name, new_name);
        }
        if (!outcome || outcome->replacements == 0) continue;

        plan.changes[rel] = std::move(outcome->text);
        plan.change_stats.push_back({rel, outcome->replacements, used->name()});
        plan.safety.total_replacements += outcome->replacements;

        if (static_cast<int>(plan.changes.size()) > max_files) {
            plan.safety.notes.push_back("Aborting: exceeded max_files limit " + std::to_string(max_files) + ".");
            spdlog::warn("⚠️ Rename {} -> {} touches more than {} files, stopping", old_name, new_name, max_files);
            break;
        }
    }

    int changed = static_cast<int>(plan.changes.size());
    plan.safety.files_changed = changed;
    plan.safety.ok = changed > 0 && changed <= max_files;

    plan.proposal = patches_.propose_from_changes(
        "Rename symbol " + old_name + " -> " + new_name,
        plan.changes,
        "Rename applied to identifier tokens only; strings/comments left unchanged."
    );
    spdlog::info("🔤 Rename {} -> {}: {} replacement(s) in {} file(s)",
                 old_name, new_name, plan.safety.total_replacements, changed);
    return plan;
}

ValidationResult RefactorEngine::apply_and_validate(const RefactorPlan& plan,
                                                    bool run_tests,
                                                    const TestRunnerFn& test_runner) const {
    ValidationResult result;
    if (!plan.proposal || plan.changes.empty()) return result;

    ApplyOptions options;
    options.unsafe = true;
    // Failing tests must be able to undo the rename
    options.require_backup = run_tests;
    ApplyResult applied = patches_.apply_patch(*plan.proposal, options);
    result.backup_id = applied.backup_id;
    if (!applied.success) {
        spdlog::error("❌ Refactor apply failed: {}", to_string(applied.failure));
        return result;
    }

    if (!run_tests) {
        result.applied = true;
        return result;
    }

    TestCounts counts;
    if (test_runner) {
        counts = test_runner();
    } else {
        validation::TestRunner runner(patches_.root(), patches_.config().test_command);
        validation::TestReport report = runner.run();
        counts = {report.failed, report.passed};
    }
    result.test_result = counts;

    if (counts.first > 0) {
        spdlog::warn("🔄 {} test(s) failed, rolling back", counts.first);
        if (!applied.backup_id) {
            spdlog::critical("💥 No backup to roll back; renamed files remain on disk");
        } else if (!patches_.rollback(*applied.backup_id)) {
            spdlog::critical("💥 Rollback of {} was incomplete", *applied.backup_id);
        }
        return result;
    }

    result.applied = true;
    return result;
}

}
