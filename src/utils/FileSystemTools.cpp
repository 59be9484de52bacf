#include "term_coder/utils/FileSystemTools.hpp"
#include "term_coder/Errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <fnmatch.h>
#include <spdlog/spdlog.h>

namespace term_coder {

namespace fs = std::filesystem;

namespace {

// Helper for sandboxing
bool is_inside_path(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;
    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        // "/a/b/" normalizes with a trailing empty element
        if (it_p->empty()) continue;
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

// `truncated` allows a multi-byte sequence cut off by the sniff window.
bool looks_like_utf8(const std::string& bytes, bool truncated) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c == 0x00) return false;
        size_t extra = 0;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return false;

        if (i + extra >= n && extra > 0) {
            if (!truncated) return false;
            for (size_t k = i + 1; k < n; ++k) {
                if ((static_cast<unsigned char>(bytes[k]) & 0xC0) != 0x80) return false;
            }
            return true;
        }
        for (size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

}

fs::path FileSystemTools::normalize_root(const fs::path& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) return root.lexically_normal();
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal();
    return canon;
}

bool FileSystemTools::is_safe_path(const fs::path& root, const fs::path& target) {
    if (root.empty()) return false;

    std::error_code ec;
    fs::path root_abs = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec) return false;
    fs::path target_abs = fs::weakly_canonical(fs::absolute(target, ec), ec);
    if (ec) return false;

    if (!is_inside_path(target_abs, root_abs)) {
        spdlog::warn("🚨 Path escape blocked! Root: {} | Target: {}", root_abs.string(), target_abs.string());
        return false;
    }
    return true;
}

std::optional<fs::path> FileSystemTools::resolve_inside(const fs::path& root, const std::string& relative_path) {
    if (relative_path.empty()) return std::nullopt;

    fs::path base = normalize_root(root);
    std::error_code ec;
    fs::path target = fs::weakly_canonical(base / relative_path, ec);
    if (ec) {
        spdlog::warn("⚠️ Cannot resolve path {}: {}", relative_path, ec.message());
        return std::nullopt;
    }
    if (!is_safe_path(base, target)) return std::nullopt;
    if (target == base) return std::nullopt;
    return target;
}

bool FileSystemTools::is_text_file(const fs::path& path, size_t max_bytes) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return false;

    std::string chunk(max_bytes, '\0');
    f.read(&chunk[0], static_cast<std::streamsize>(max_bytes));
    chunk.resize(static_cast<size_t>(f.gcount()));
    bool truncated = f.peek() != std::char_traits<char>::eof();
    return looks_like_utf8(chunk, truncated);
}

std::optional<std::string> FileSystemTools::read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return std::nullopt;
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) return std::nullopt;
    return buffer.str();
}

void FileSystemTools::write_file(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PatchIoError("cannot open for writing: " + path.string());
    }
    out << data;
    out.flush();
    if (out.fail()) {
        throw PatchIoError("write failed: " + path.string());
    }
}

bool FileSystemTools::glob_match(const std::string& pattern, const std::string& relative_path) {
    return fnmatch(pattern.c_str(), relative_path.c_str(), 0) == 0;
}

const std::vector<std::string>& FileSystemTools::default_exclude_dirs() {
    static const std::vector<std::string> dirs = {
        ".git", ".hg", ".svn", ".idea", ".vscode", "node_modules",
        ".venv", "venv", "dist", "build", "__pycache__", ".term-coder"
    };
    return dirs;
}

std::vector<std::string> FileSystemTools::iter_source_files(
    const fs::path& root,
    const std::vector<std::string>& include_globs,
    const std::vector<std::string>& exclude_globs
) {
    std::vector<std::string> out;
    fs::path base = normalize_root(root);

    std::error_code ec;
    if (!fs::is_directory(base, ec)) return out;

    const auto& excluded = default_exclude_dirs();
    auto iter_options = fs::directory_options::skip_permission_denied;
    fs::recursive_directory_iterator it(base, iter_options, ec);
    if (ec) {
        spdlog::warn("⚠️ Cannot walk {}: {}", base.string(), ec.message());
        return out;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("⚠️ Walk error under {}: {}", base.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();

        if (entry.is_directory(ec)) {
            if (std::find(excluded.begin(), excluded.end(), name) != excluded.end()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;

        std::string rel = entry.path().lexically_relative(base).generic_string();

        bool skip = false;
        for (const auto& g : exclude_globs) {
            if (glob_match(g, rel)) { skip = true; break; }
        }
        if (skip) continue;

        if (!include_globs.empty()) {
            bool matched = false;
            for (const auto& g : include_globs) {
                if (glob_match(g, rel)) { matched = true; break; }
            }
            if (!matched) continue;
        }

        // Symlinked files must still land inside the root
        if (entry.is_symlink(ec) && !is_safe_path(base, entry.path())) continue;

        out.push_back(rel);
    }

    std::sort(out.begin(), out.end());
    return out;
}

}
