#pragma once
#include <map>
#include <string>
#include <vector>
#include <filesystem>

namespace term_coder {

// Best-effort, in-place formatting of freshly written files. Missing tools and
// non-zero exits are logged and otherwise ignored.
class FormatterRunner {
public:
    FormatterRunner(const std::filesystem::path& root,
                    std::map<std::string, std::vector<std::string>> formatters);

    // Returns the number of formatter invocations that exited cleanly.
    int run(const std::vector<std::string>& relative_paths) const;

private:
    std::filesystem::path root_;
    std::map<std::string, std::vector<std::string>> formatters_;
};

}
