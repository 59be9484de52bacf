#pragma once
#include <string>
#include <optional>
#include "term_coder/refactor/SourceTokenizer.hpp"

namespace term_coder::refactor {

struct RenameOutcome {
    std::string text;
    int replacements = 0;
};

class Renamer {
public:
    virtual ~Renamer() = default;

    // nullopt means this renamer cannot handle the file and the caller should
    // try another strategy. A result with zero replacements is still a result.
    virtual std::optional<RenameOutcome> rename(const std::string& content,
                                                const std::string& extension,
                                                const std::string& old_name,
                                                const std::string& new_name) = 0;

    virtual std::string name() const = 0;
};

// Replaces identifier leaves only; every other byte is copied through.
class TokenAwareRenamer : public Renamer {
public:
    std::optional<RenameOutcome> rename(const std::string& content,
                                        const std::string& extension,
                                        const std::string& old_name,
                                        const std::string& new_name) override;

    std::string name() const override { return "token"; }

private:
    SourceTokenizer tokenizer_;
};

// Whole-word `\bold\b` substitution over raw text, strings and comments included.
class RegexFallbackRenamer : public Renamer {
public:
    std::optional<RenameOutcome> rename(const std::string& content,
                                        const std::string& extension,
                                        const std::string& old_name,
                                        const std::string& new_name) override;

    std::string name() const override { return "regex"; }
};

// ASCII identifier: [A-Za-z_][A-Za-z0-9_]*
bool is_valid_identifier(const std::string& name);

}
