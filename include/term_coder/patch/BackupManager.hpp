#pragma once
#include <string>
#include <vector>
#include <filesystem>

namespace term_coder {

struct BackupResult {
    std::string backup_id;
    std::vector<std::string> saved;   // root-relative paths of the resolved files copied into the snapshot
    std::vector<std::string> failed;  // relative paths that could not be copied

    bool ok() const { return failed.empty(); }
};

// Snapshot store under <root>/.term-coder/backups/<id>/<relative path>.
class BackupManager {
public:
    explicit BackupManager(const std::filesystem::path& root);

    // 🛡️ Copies every existing regular file of `relative_paths` into a fresh
    // snapshot. Missing files and paths outside the root are not failures.
    BackupResult create_backup(const std::vector<std::string>& relative_paths) const;

    // 🔄 Restores every file stored under `backup_id`. False when the snapshot
    // does not exist or any file failed to restore (listed in `failed_paths`).
    bool rollback(const std::string& backup_id, std::vector<std::string>* failed_paths = nullptr) const;

    // Removes a snapshot directory. False when it did not exist.
    bool discard(const std::string& backup_id) const;

    std::vector<std::string> list_backups() const;

    std::filesystem::path backup_dir(const std::string& backup_id) const;
    std::filesystem::path backups_root() const;

private:
    std::filesystem::path root_;

    std::string next_backup_id() const;
};

}
