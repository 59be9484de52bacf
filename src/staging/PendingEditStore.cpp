#include "term_coder/staging/PendingEditStore.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include "term_coder/Errors.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace term_coder::staging {

namespace fs = std::filesystem;
using json = nlohmann::json;

PendingEditStore::PendingEditStore(const fs::path& root)
    : slot_(FileSystemTools::normalize_root(root) / ".term-coder" / "pending_edit.json") {}

void PendingEditStore::save(const PendingEdit& edit) const {
    std::error_code ec;
    fs::create_directories(slot_.parent_path(), ec);
    if (ec) throw PatchIoError("cannot create " + slot_.parent_path().string() + ": " + ec.message());

    fs::path temp = slot_;
    temp += ".tmp";
    FileSystemTools::write_file(temp, edit.to_json().dump(2));

    fs::rename(temp, slot_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw PatchIoError("cannot replace " + slot_.string() + ": " + ec.message());
    }
    spdlog::info("💾 Pending edit saved ({} file(s))", edit.proposal.affected_files.size());
}

std::optional<PendingEdit> PendingEditStore::load() const {
    std::error_code ec;
    if (!fs::exists(slot_, ec)) return std::nullopt;

    std::ifstream f(slot_);
    if (!f.is_open()) return std::nullopt;
    try {
        return PendingEdit::from_json(json::parse(f));
    } catch (const json::exception& e) {
        spdlog::warn("❌ Ignoring malformed pending edit {}: {}", slot_.string(), e.what());
    }
    return std::nullopt;
}

void PendingEditStore::clear() const {
    std::error_code ec;
    fs::remove(slot_, ec);
    if (ec) spdlog::warn("⚠️ Could not clear pending edit: {}", ec.message());
}

}
