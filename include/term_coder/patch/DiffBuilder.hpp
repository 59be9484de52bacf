#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "term_coder/patch/PatchTypes.hpp"

namespace term_coder {

// Renders whole-file replacements as unified diff text against the files
// currently on disk under `root`.
class DiffBuilder {
public:
    explicit DiffBuilder(const std::filesystem::path& root);

    // One section per changed path, sections separated by a blank line.
    // Unchanged files and paths escaping the root contribute nothing.
    std::string build(const ChangeSet& changes, int context_lines = 3) const;

    // Diff of two in-memory texts with "--- a/<path>" / "+++ b/<path>" headers.
    // Empty when the texts are equal.
    static std::string unified_diff(const std::string& original,
                                    const std::string& updated,
                                    const std::string& rel_path,
                                    int context_lines = 3);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    std::string read_original(const std::string& rel_path) const;
};

}
