#include "term_coder/patch/PatchSystem.hpp"
#include "term_coder/patch/DiffAnalyzer.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include <spdlog/spdlog.h>

namespace term_coder {

namespace fs = std::filesystem;

PatchSystem::PatchSystem(const fs::path& root)
    : PatchSystem(root, EngineConfig::load(FileSystemTools::normalize_root(root))) {
    configure_logging(config_);
}

PatchSystem::PatchSystem(const fs::path& root, EngineConfig config)
    : root_(FileSystemTools::normalize_root(root)),
      config_(std::move(config)),
      diff_builder_(root_),
      scorer_(config_.thresholds),
      applier_(root_, config_.formatters) {}

PatchProposal PatchSystem::package(const std::string& instruction, std::string diff,
                                   std::string rationale, std::optional<ChangeSet> contents) const {
    DiffAnalysis analysis = DiffAnalyzer::analyze(diff);

    PatchProposal proposal;
    proposal.instruction = instruction;
    proposal.diff = std::move(diff);
    proposal.rationale = std::move(rationale);
    proposal.affected_files = std::move(analysis.affected_files);
    proposal.estimated_impact = analysis.impact;
    proposal.safety_score = scorer_.score(proposal.estimated_impact);
    proposal.new_contents = std::move(contents);

    spdlog::info("📝 Proposal: {} file(s), +{} -{}, safety {:.2f}",
                 proposal.estimated_impact.files_changed,
                 proposal.estimated_impact.lines_added,
                 proposal.estimated_impact.lines_removed,
                 proposal.safety_score);
    return proposal;
}

PatchProposal PatchSystem::propose_from_changes(const std::string& instruction,
                                                const ChangeSet& changes,
                                                const std::string& rationale) const {
    return package(instruction, diff_builder_.build(changes),
                   rationale.empty() ? "Proposed changes derived from explicit edits." : rationale,
                   changes);
}

PatchProposal PatchSystem::propose_from_diff(const std::string& instruction,
                                             const std::string& diff,
                                             const std::string& rationale) const {
    return package(instruction, diff,
                   rationale.empty() ? "Proposed changes parsed from a unified diff." : rationale,
                   std::nullopt);
}

ApplyResult PatchSystem::apply_patch(const PatchProposal& proposal, ApplyOptions options) const {
    if (options.require_backup) {
        options.create_backup = true;
    } else if (!config_.create_backups && options.create_backup) {
        spdlog::warn("⚠️ Backups disabled by configuration (safety.create_backups=false)");
        options.create_backup = false;
    }
    return applier_.apply_patch(proposal, options);
}

BackupResult PatchSystem::create_backup(const std::vector<std::string>& relative_paths) const {
    return applier_.backups().create_backup(relative_paths);
}

bool PatchSystem::rollback(const std::string& backup_id, std::vector<std::string>* failed_paths) const {
    return applier_.backups().rollback(backup_id, failed_paths);
}

}
