#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "term_coder/patch/PatchTypes.hpp"
#include "term_coder/patch/DiffBuilder.hpp"
#include "term_coder/patch/SafetyScorer.hpp"
#include "term_coder/patch/PatchApplier.hpp"
#include "term_coder/config/EngineConfig.hpp"

namespace term_coder {

// Entry point of the patch engine for a single project root.
class PatchSystem {
public:
    // Loads <root>/.term-coder/config.json and applies its log level.
    explicit PatchSystem(const std::filesystem::path& root);
    PatchSystem(const std::filesystem::path& root, EngineConfig config);

    PatchProposal propose_from_changes(const std::string& instruction,
                                       const ChangeSet& changes,
                                       const std::string& rationale = "") const;

    // For producers that only hand back diff text. The proposal carries no
    // new_contents and cannot be applied.
    PatchProposal propose_from_diff(const std::string& instruction,
                                    const std::string& diff,
                                    const std::string& rationale = "") const;

    ApplyResult apply_patch(const PatchProposal& proposal, ApplyOptions options = {}) const;

    BackupResult create_backup(const std::vector<std::string>& relative_paths) const;
    bool rollback(const std::string& backup_id, std::vector<std::string>* failed_paths = nullptr) const;

    const std::filesystem::path& root() const { return root_; }
    const EngineConfig& config() const { return config_; }
    const BackupManager& backups() const { return applier_.backups(); }

private:
    std::filesystem::path root_;
    EngineConfig config_;
    DiffBuilder diff_builder_;
    SafetyScorer scorer_;
    PatchApplier applier_;

    PatchProposal package(const std::string& instruction, std::string diff,
                          std::string rationale, std::optional<ChangeSet> contents) const;
};

}
