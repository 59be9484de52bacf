#include "term_coder/patch/DiffBuilder.hpp"
#include "term_coder/patch/LineDiff.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include <spdlog/spdlog.h>

namespace term_coder {

namespace fs = std::filesystem;

namespace {

void emit_line(std::vector<std::string>& out, char prefix, const std::string& line) {
    if (!line.empty() && line.back() == '\n') {
        out.push_back(prefix + line.substr(0, line.size() - 1));
    } else {
        out.push_back(prefix + line);
        out.push_back("\\ No newline at end of file");
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

}

DiffBuilder::DiffBuilder(const fs::path& root)
    : root_(FileSystemTools::normalize_root(root)) {}

std::string DiffBuilder::read_original(const std::string& rel_path) const {
    auto target = FileSystemTools::resolve_inside(root_, rel_path);
    if (!target) return "";

    std::error_code ec;
    if (!fs::is_regular_file(*target, ec)) return "";
    if (!FileSystemTools::is_text_file(*target)) {
        spdlog::debug("Binary file treated as empty original: {}", rel_path);
        return "";
    }
    return FileSystemTools::read_file(*target).value_or("");
}

std::string DiffBuilder::unified_diff(const std::string& original,
                                      const std::string& updated,
                                      const std::string& rel_path,
                                      int context_lines) {
    auto a = LineDiff::split_lines(original);
    auto b = LineDiff::split_lines(updated);
    auto groups = LineDiff::group_opcodes(LineDiff::compute_opcodes(a, b), context_lines);
    if (groups.empty()) return "";

    std::vector<std::string> out;
    out.push_back("--- a/" + rel_path);
    out.push_back("+++ b/" + rel_path);

    for (const auto& group : groups) {
        const Opcode& first = group.front();
        const Opcode& last = group.back();
        out.push_back("@@ -" + LineDiff::format_range(first.i1, last.i2) +
                      " +" + LineDiff::format_range(first.j1, last.j2) + " @@");

        for (const auto& op : group) {
            if (op.tag == OpTag::EQUAL) {
                for (int i = op.i1; i < op.i2; ++i) emit_line(out, ' ', a[i]);
                continue;
            }
            if (op.tag == OpTag::REPLACE || op.tag == OpTag::DELETE) {
                for (int i = op.i1; i < op.i2; ++i) emit_line(out, '-', a[i]);
            }
            if (op.tag == OpTag::REPLACE || op.tag == OpTag::INSERT) {
                for (int j = op.j1; j < op.j2; ++j) emit_line(out, '+', b[j]);
            }
        }
    }
    return join(out, "\n");
}

std::string DiffBuilder::build(const ChangeSet& changes, int context_lines) const {
    std::vector<std::string> parts;
    for (const auto& [rel_path, new_content] : changes) {
        // Escaping paths are dropped before any read
        if (!FileSystemTools::resolve_inside(root_, rel_path)) {
            spdlog::warn("🛑 Skipping path outside project root: {}", rel_path);
            continue;
        }
        std::string section = unified_diff(read_original(rel_path), new_content, rel_path, context_lines);
        if (!section.empty()) parts.push_back(std::move(section));
    }
    return join(parts, "\n\n");
}

}
