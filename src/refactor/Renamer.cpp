#include "term_coder/refactor/Renamer.hpp"
#include <regex>
#include <cctype>

namespace term_coder::refactor {

bool is_valid_identifier(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_')) return false;
    for (unsigned char c : name) {
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

std::optional<RenameOutcome> TokenAwareRenamer::rename(const std::string& content,
                                                       const std::string& extension,
                                                       const std::string& old_name,
                                                       const std::string& new_name) {
    SourceLanguage lang = SourceTokenizer::language_for(extension);
    auto tokens = tokenizer_.tokenize(content, extension);
    if (!tokens) return std::nullopt;

    RenameOutcome out;
    out.text.reserve(content.size());
    size_t cursor = 0;

    for (const auto& tok : *tokens) {
        if (!tok.named || !SourceTokenizer::is_identifier_kind(lang, tok.kind)) continue;
        if (tok.end_byte - tok.start_byte != old_name.size()) continue;
        if (content.compare(tok.start_byte, old_name.size(), old_name) != 0) continue;

        out.text.append(content, cursor, tok.start_byte - cursor);
        out.text.append(new_name);
        cursor = tok.end_byte;
        out.replacements++;
    }
    out.text.append(content, cursor, std::string::npos);
    return out;
}

std::optional<RenameOutcome> RegexFallbackRenamer::rename(const std::string& content,
                                                          const std::string& /*extension*/,
                                                          const std::string& old_name,
                                                          const std::string& new_name) {
    // Callers validate both names as identifiers, so no regex metacharacters
    const std::regex word("\\b" + old_name + "\\b");

    RenameOutcome out;
    size_t cursor = 0;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), word);
         it != std::sregex_iterator(); ++it) {
        size_t pos = static_cast<size_t>(it->position(0));
        out.text.append(content, cursor, pos - cursor);
        out.text.append(new_name);
        cursor = pos + static_cast<size_t>(it->length(0));
        out.replacements++;
    }
    out.text.append(content, cursor, std::string::npos);
    return out;
}

}
