#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace term_coder {

class FileSystemTools {
public:
    // Absolute, symlink-resolved form of a project root.
    static std::filesystem::path normalize_root(const std::filesystem::path& root);

    // 🛡️ Sandbox: true when `target` resolves to `root` or below it.
    static bool is_safe_path(const std::filesystem::path& root, const std::filesystem::path& target);

    // Resolves `relative_path` against `root`. Returns nullopt (and logs) when the
    // result escapes the root or is the root itself.
    static std::optional<std::filesystem::path> resolve_inside(
        const std::filesystem::path& root,
        const std::string& relative_path
    );

    // UTF-8 sniff of the first `max_bytes`; NUL bytes mark a file as binary.
    static bool is_text_file(const std::filesystem::path& path, size_t max_bytes = 4096);

    static std::optional<std::string> read_file(const std::filesystem::path& path);

    // Truncating binary write. Throws PatchIoError.
    static void write_file(const std::filesystem::path& path, const std::string& data);

    // fnmatch(3) semantics without FNM_PATHNAME: `*` also crosses '/'.
    static bool glob_match(const std::string& pattern, const std::string& relative_path);

    static const std::vector<std::string>& default_exclude_dirs();

    // Regular files under `root` (relative, generic form, sorted) that match one of
    // `include_globs` (all files when empty) and none of `exclude_globs`.
    static std::vector<std::string> iter_source_files(
        const std::filesystem::path& root,
        const std::vector<std::string>& include_globs,
        const std::vector<std::string>& exclude_globs
    );
};

}
