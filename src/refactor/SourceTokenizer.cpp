#include "term_coder/refactor/SourceTokenizer.hpp"
#include <spdlog/spdlog.h>
#include <stack>
#include <cstring>

// Grammar entry points from the tree-sitter-cpp and tree-sitter-python libraries
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
}

namespace term_coder::refactor {

SourceTokenizer::SourceTokenizer() {
    parser_ = ts_parser_new();
}

SourceTokenizer::~SourceTokenizer() {
    if (parser_) ts_parser_delete(parser_);
}

SourceLanguage SourceTokenizer::language_for(const std::string& ext) {
    if (ext == ".py") return SourceLanguage::PYTHON;
    // C sources go through the C++ grammar; C code using C++ keywords as names
    // parses with errors and takes the regex path.
    if (ext == ".cpp" || ext == ".hpp" || ext == ".h" || ext == ".cc" ||
        ext == ".cxx" || ext == ".hh" || ext == ".c") return SourceLanguage::CPP;
    return SourceLanguage::NONE;
}

const TSLanguage* SourceTokenizer::grammar(SourceLanguage lang) {
    switch (lang) {
        case SourceLanguage::CPP: return tree_sitter_cpp();
        case SourceLanguage::PYTHON: return tree_sitter_python();
        case SourceLanguage::NONE: break;
    }
    return nullptr;
}

bool SourceTokenizer::is_identifier_kind(SourceLanguage lang, const std::string& kind) {
    if (lang == SourceLanguage::PYTHON) return kind == "identifier";
    if (lang == SourceLanguage::CPP) {
        return kind == "identifier" || kind == "field_identifier" ||
               kind == "type_identifier" || kind == "namespace_identifier";
    }
    return false;
}

std::optional<std::vector<SourceToken>> SourceTokenizer::tokenize(const std::string& content,
                                                                  const std::string& extension) {
    SourceLanguage language = language_for(extension);
    const TSLanguage* lang = grammar(language);
    if (!lang || !parser_) return std::nullopt;

    if (!ts_parser_set_language(parser_, lang)) {
        spdlog::warn("⚠️ tree-sitter grammar for {} is ABI-incompatible", extension);
        return std::nullopt;
    }

    TSTree* tree = ts_parser_parse_string(parser_, nullptr, content.c_str(), (uint32_t)content.length());
    if (!tree) return std::nullopt;

    TSNode root = ts_tree_root_node(tree);
    if (ts_node_has_error(root) || ts_node_is_missing(root)) {
        ts_tree_delete(tree);
        return std::nullopt;
    }

    std::vector<SourceToken> leaves;
    std::stack<TSNode> traversal_stack;
    traversal_stack.push(root);

    while (!traversal_stack.empty()) {
        TSNode node = traversal_stack.top();
        traversal_stack.pop();

        uint32_t count = ts_node_child_count(node);
        // Python strings, f-string interpolations included, stay one opaque leaf
        bool opaque = language == SourceLanguage::PYTHON && std::strcmp(ts_node_type(node), "string") == 0;
        if (count == 0 || opaque) {
            SourceToken tok;
            tok.kind = ts_node_type(node);
            tok.start_byte = ts_node_start_byte(node);
            tok.end_byte = ts_node_end_byte(node);
            tok.named = ts_node_is_named(node);
            leaves.push_back(std::move(tok));
            continue;
        }
        // Reverse push keeps document order on pop
        for (uint32_t i = count; i > 0; i--) {
            traversal_stack.push(ts_node_child(node, i - 1));
        }
    }

    ts_tree_delete(tree);
    return leaves;
}

}
