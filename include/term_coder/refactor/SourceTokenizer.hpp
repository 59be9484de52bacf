#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <tree_sitter/api.h>

namespace term_coder::refactor {

enum class SourceLanguage { NONE, CPP, PYTHON };

// A leaf of the concrete syntax tree: byte range into the parsed text plus
// the grammar's node type ("identifier", "comment", "string_content", ...).
struct SourceToken {
    std::string kind;
    uint32_t start_byte = 0;
    uint32_t end_byte = 0;
    bool named = false;
};

// 🚀 Lexical leaf stream backed by tree-sitter. One parser per instance; not
// thread-safe.
class SourceTokenizer {
public:
    SourceTokenizer();
    ~SourceTokenizer();

    SourceTokenizer(const SourceTokenizer&) = delete;
    SourceTokenizer& operator=(const SourceTokenizer&) = delete;

    static SourceLanguage language_for(const std::string& extension);

    // True when `kind` names an identifier leaf in `lang`.
    static bool is_identifier_kind(SourceLanguage lang, const std::string& kind);

    // Leaves in document order. nullopt when the extension has no grammar or
    // the parse contains ERROR/MISSING nodes.
    std::optional<std::vector<SourceToken>> tokenize(const std::string& content,
                                                     const std::string& extension);

private:
    TSParser* parser_;

    static const TSLanguage* grammar(SourceLanguage lang);
};

}
