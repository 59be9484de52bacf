#pragma once
#include <map>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "term_coder/patch/PatchTypes.hpp"
#include "term_coder/patch/BackupManager.hpp"
#include "term_coder/patch/FormatterRunner.hpp"

namespace term_coder {

enum class ApplyFailure {
    NONE,
    LOCKED,                      // another apply holds the root lock
    NOTHING_TO_APPLY,            // no candidate survived the root/existence filters
    BACKUP_FAILED,               // a snapshot copy failed; nothing was written
    MISSING_REPLACEMENT_CONTENT  // proposal carries a diff but no whole-file contents
};

std::string to_string(ApplyFailure failure);

struct ApplyOptions {
    std::optional<std::vector<std::string>> pick_files; // restrict to these affected files
    bool create_backup = true;
    bool require_backup = false;  // snapshot even when configuration disables backups
    bool run_formatters = true;
    bool unsafe = false;  // allow creating files that do not exist yet
};

struct ApplyResult {
    bool success = false;
    std::optional<std::string> backup_id;
    std::vector<std::string> written;
    std::vector<std::string> skipped;  // candidates with no entry in new_contents
    ApplyFailure failure = ApplyFailure::NONE;
};

// Whole-file apply with snapshot-first, stage-then-rename semantics: either every
// written file reflects the proposal or, from the caller's view, none does.
// Staging or commit I/O failures throw PatchIoError after undoing partial work.
class PatchApplier {
public:
    PatchApplier(const std::filesystem::path& root,
                 std::map<std::string, std::vector<std::string>> formatters);

    ApplyResult apply_patch(const PatchProposal& proposal, const ApplyOptions& options = {}) const;

    const BackupManager& backups() const { return backups_; }

private:
    struct StagedWrite {
        std::string rel;
        std::filesystem::path target;
        std::filesystem::path temp;
        bool existed;
    };

    std::filesystem::path root_;
    BackupManager backups_;
    FormatterRunner formatter_;

    void discard_staged(const std::vector<StagedWrite>& staged, size_t from) const;
    void undo_commits(const std::vector<StagedWrite>& staged, size_t count,
                      const std::optional<std::string>& backup_id) const;
};

}
