#include "term_coder/patch/PatchApplier.hpp"
#include "term_coder/patch/ApplyLock.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include "term_coder/Errors.hpp"
#include <chrono>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace term_coder {

namespace fs = std::filesystem;

std::string to_string(ApplyFailure failure) {
    switch (failure) {
        case ApplyFailure::NONE: return "none";
        case ApplyFailure::LOCKED: return "locked";
        case ApplyFailure::NOTHING_TO_APPLY: return "nothing to apply";
        case ApplyFailure::BACKUP_FAILED: return "backup failed";
        case ApplyFailure::MISSING_REPLACEMENT_CONTENT: return "missing replacement content";
    }
    return "unknown";
}

PatchApplier::PatchApplier(const fs::path& root,
                           std::map<std::string, std::vector<std::string>> formatters)
    : root_(FileSystemTools::normalize_root(root)),
      backups_(root_),
      formatter_(root_, std::move(formatters)) {}

void PatchApplier::discard_staged(const std::vector<StagedWrite>& staged, size_t from) const {
    for (size_t i = from; i < staged.size(); ++i) {
        std::error_code ec;
        fs::remove(staged[i].temp, ec);
        if (ec) spdlog::warn("⚠️ Could not remove temp file {}: {}", staged[i].temp.string(), ec.message());
    }
}

void PatchApplier::undo_commits(const std::vector<StagedWrite>& staged, size_t count,
                                const std::optional<std::string>& backup_id) const {
    for (size_t i = 0; i < count; ++i) {
        const auto& s = staged[i];
        std::error_code ec;
        if (!s.existed) {
            fs::remove(s.target, ec);
        } else if (backup_id) {
            fs::path saved = backups_.backup_dir(*backup_id) / s.target.lexically_relative(root_);
            fs::copy_file(saved, s.target, fs::copy_options::overwrite_existing, ec);
        } else {
            spdlog::critical("💥 {} was replaced without a backup and cannot be restored", s.rel);
            continue;
        }
        if (ec) spdlog::critical("💥 Undo failed for {}: {}. Manual repair required!", s.rel, ec.message());
    }
}

ApplyResult PatchApplier::apply_patch(const PatchProposal& proposal, const ApplyOptions& options) const {
    ApplyResult result;

    ApplyLock lock(root_);
    if (!lock.acquired()) {
        result.failure = ApplyFailure::LOCKED;
        return result;
    }

    // 1. Candidate selection
    std::vector<std::string> apply_list;
    std::vector<fs::path> targets;
    for (const auto& rel : proposal.affected_files) {
        if (options.pick_files) {
            const auto& picks = *options.pick_files;
            if (std::find(picks.begin(), picks.end(), rel) == picks.end()) continue;
        }
        auto target = FileSystemTools::resolve_inside(root_, rel);
        if (!target) continue;

        std::error_code ec;
        if (!options.unsafe && !fs::exists(*target, ec)) {
            spdlog::info("⏭️ Not creating {} (file does not exist and apply is safe-mode)", rel);
            continue;
        }
        apply_list.push_back(rel);
        targets.push_back(*target);
    }

    if (apply_list.empty()) {
        result.failure = ApplyFailure::NOTHING_TO_APPLY;
        return result;
    }

    // 2. Journal
    if (options.create_backup) {
        BackupResult backup = backups_.create_backup(apply_list);
        if (!backup.ok()) {
            if (!backup.backup_id.empty()) backups_.discard(backup.backup_id);
            spdlog::error("🚨 Apply aborted: backup incomplete ({} files failed)", backup.failed.size());
            result.failure = ApplyFailure::BACKUP_FAILED;
            return result;
        }
        result.backup_id = backup.backup_id;
    }

    if (!proposal.new_contents) {
        spdlog::error("❌ Proposal has no whole-file contents; hunk application is not supported.");
        result.failure = ApplyFailure::MISSING_REPLACEMENT_CONTENT;
        return result;
    }
    const ChangeSet& contents = *proposal.new_contents;

    // 3. Stage every write next to its target
    auto token = std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    std::vector<StagedWrite> staged;
    try {
        for (size_t i = 0; i < apply_list.size(); ++i) {
            auto it = contents.find(apply_list[i]);
            if (it == contents.end()) {
                result.skipped.push_back(apply_list[i]);
                continue;
            }
            const fs::path& target = targets[i];
            fs::create_directories(target.parent_path());

            StagedWrite s{apply_list[i], target,
                          target.parent_path() / ("." + target.filename().string() + ".tc-tmp-" + token),
                          fs::exists(target)};
            staged.push_back(s);
            FileSystemTools::write_file(s.temp, it->second);
            if (s.existed) {
                fs::permissions(s.temp, fs::status(target).permissions(), fs::perm_options::replace);
            }
        }
    } catch (const PatchIoError&) {
        discard_staged(staged, 0);
        throw;
    } catch (const fs::filesystem_error& e) {
        discard_staged(staged, 0);
        throw PatchIoError(std::string("staging failed: ") + e.what());
    }

    // 4. Commit: rename into place
    for (size_t i = 0; i < staged.size(); ++i) {
        std::error_code ec;
        fs::rename(staged[i].temp, staged[i].target, ec);
        if (ec) {
            spdlog::error("💥 Commit failed on {}: {}. Undoing {} file(s).", staged[i].rel, ec.message(), i);
            undo_commits(staged, i, result.backup_id);
            discard_staged(staged, i);
            throw PatchIoError("commit failed for " + staged[i].rel + ": " + ec.message());
        }
        result.written.push_back(staged[i].rel);
    }

    // 5. Formatting never fails an apply
    if (options.run_formatters && !result.written.empty()) {
        formatter_.run(result.written);
    }

    spdlog::info("🏗️ Applied {} file(s), skipped {}", result.written.size(), result.skipped.size());
    result.success = true;
    return result;
}

}
