#include "term_coder/staging/InstructionEditor.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include <regex>
#include <spdlog/spdlog.h>

namespace term_coder::staging {

namespace fs = std::filesystem;

namespace {

std::string replace_all(const std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return text;
    std::string out;
    size_t cursor = 0;
    size_t pos;
    while ((pos = text.find(from, cursor)) != std::string::npos) {
        out.append(text, cursor, pos - cursor);
        out.append(to);
        cursor = pos + from.size();
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

}

InstructionEditor::InstructionEditor(const PatchSystem& patches) : patches_(patches) {}

ChangeSet InstructionEditor::apply_instruction(const std::string& instruction,
                                               const std::vector<std::string>& files) const {
    static const std::regex replace_re(R"(replace\s+'(.+?)'\s*->\s*'(.+?)')", std::regex::icase);
    static const std::regex append_re(R"(append\s+'(.+?)')", std::regex::icase);
    static const std::regex prepend_re(R"(prepend\s+'(.+?)')", std::regex::icase);

    std::smatch m;
    enum class Shape { NONE, REPLACE, APPEND, PREPEND } shape = Shape::NONE;
    std::string a, b;
    if (std::regex_search(instruction, m, replace_re)) {
        shape = Shape::REPLACE;
        a = m[1].str();
        b = m[2].str();
    } else if (std::regex_search(instruction, m, append_re)) {
        shape = Shape::APPEND;
        a = m[1].str();
    } else if (std::regex_search(instruction, m, prepend_re)) {
        shape = Shape::PREPEND;
        a = m[1].str();
    }

    ChangeSet changes;
    if (shape == Shape::NONE) return changes;

    for (const auto& rel : files) {
        auto target = FileSystemTools::resolve_inside(patches_.root(), rel);
        if (!target) continue;
        std::string original = FileSystemTools::read_file(*target).value_or("");

        switch (shape) {
            case Shape::REPLACE:
                changes[rel] = replace_all(original, a, b);
                break;
            case Shape::APPEND: {
                bool needs_break = original.empty() || original.back() != '\n';
                changes[rel] = original + (needs_break ? "\n" : "") + a + "\n";
                break;
            }
            case Shape::PREPEND:
                changes[rel] = a + "\n" + original;
                break;
            case Shape::NONE:
                break;
        }
    }
    return changes;
}

std::optional<PendingEdit> InstructionEditor::generate(const std::string& instruction,
                                                       const std::vector<std::string>& files) const {
    ChangeSet changes = apply_instruction(instruction, files);

    PatchProposal proposal = patches_.propose_from_changes(
        instruction, changes, "Applied deterministic transformations based on instruction.");
    if (proposal.affected_files.empty()) {
        spdlog::info("🤷 Instruction produced no changes: {}", instruction);
        return std::nullopt;
    }
    return PendingEdit{instruction, std::move(proposal)};
}

}
