#include "term_coder/patch/BackupManager.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include <chrono>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace term_coder {

namespace fs = std::filesystem;

namespace {

bool is_valid_backup_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

}

BackupManager::BackupManager(const fs::path& root)
    : root_(FileSystemTools::normalize_root(root)) {}

fs::path BackupManager::backups_root() const {
    return root_ / ".term-coder" / "backups";
}

fs::path BackupManager::backup_dir(const std::string& backup_id) const {
    return backups_root() / backup_id;
}

// Millisecond timestamp; "-N" suffix when another snapshot already claimed it.
std::string BackupManager::next_backup_id() const {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string base = std::to_string(ms);

    fs::create_directories(backups_root());
    std::string id = base;
    for (int n = 1; !fs::create_directory(backup_dir(id)); ++n) {
        id = base + "-" + std::to_string(n);
    }
    return id;
}

BackupResult BackupManager::create_backup(const std::vector<std::string>& relative_paths) const {
    BackupResult result;
    try {
        result.backup_id = next_backup_id();
    } catch (const fs::filesystem_error& e) {
        spdlog::error("🚨 Cannot create backup directory: {}", e.what());
        result.failed = relative_paths;
        return result;
    }
    fs::path snapshot = backup_dir(result.backup_id);

    for (const auto& rel : relative_paths) {
        auto src = FileSystemTools::resolve_inside(root_, rel);
        if (!src) continue;

        std::error_code ec;
        if (!fs::exists(*src, ec) || !fs::is_regular_file(*src, ec)) continue;

        // Mirror the resolved location so "../<root>/a.txt" lands at <snapshot>/a.txt
        fs::path mirrored = src->lexically_relative(root_);
        fs::path dst = snapshot / mirrored;
        fs::create_directories(dst.parent_path(), ec);
        if (!ec) fs::copy_file(*src, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::error("🚨 Backup copy failed for {}: {}", rel, ec.message());
            result.failed.push_back(rel);
            continue;
        }
        result.saved.push_back(mirrored.generic_string());
    }

    spdlog::info("🛡️ Backup {} created ({} files, {} failed)", result.backup_id, result.saved.size(), result.failed.size());
    return result;
}

bool BackupManager::rollback(const std::string& backup_id, std::vector<std::string>* failed_paths) const {
    if (!is_valid_backup_id(backup_id)) return false;

    fs::path snapshot = backup_dir(backup_id);
    std::error_code ec;
    if (!fs::is_directory(snapshot, ec)) {
        spdlog::warn("⚠️ Rollback target missing: {}", backup_id);
        return false;
    }

    bool all_ok = true;
    auto record_failure = [&](const std::string& rel, const std::string& why) {
        spdlog::critical("💥 ROLLBACK FAILED for {}: {}. Manual repair required!", rel, why);
        all_ok = false;
        if (failed_paths) failed_paths->push_back(rel);
    };

    fs::recursive_directory_iterator it(snapshot, ec);
    if (ec) {
        spdlog::critical("💥 Cannot read backup {}: {}", backup_id, ec.message());
        return false;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            record_failure(snapshot.string(), ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) continue;

        std::string rel = it->path().lexically_relative(snapshot).generic_string();
        auto dst = FileSystemTools::resolve_inside(root_, rel);
        if (!dst) {
            record_failure(rel, "resolves outside project root");
            continue;
        }

        std::error_code copy_ec;
        fs::create_directories(dst->parent_path(), copy_ec);
        if (!copy_ec) fs::copy_file(it->path(), *dst, fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            record_failure(rel, copy_ec.message());
            continue;
        }
    }

    if (all_ok) spdlog::warn("🔄 Rollback {} restored", backup_id);
    return all_ok;
}

bool BackupManager::discard(const std::string& backup_id) const {
    if (!is_valid_backup_id(backup_id)) return false;
    std::error_code ec;
    auto removed = fs::remove_all(backup_dir(backup_id), ec);
    if (ec) {
        spdlog::warn("⚠️ Could not discard backup {}: {}", backup_id, ec.message());
        return false;
    }
    return removed > 0;
}

std::vector<std::string> BackupManager::list_backups() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(backups_root(), ec)) return ids;
    for (const auto& entry : fs::directory_iterator(backups_root(), ec)) {
        if (entry.is_directory(ec)) ids.push_back(entry.path().filename().string());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}
