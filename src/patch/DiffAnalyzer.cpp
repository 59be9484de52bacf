#include "term_coder/patch/DiffAnalyzer.hpp"
#include <regex>
#include <sstream>
#include <algorithm>

namespace term_coder {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

}

DiffAnalysis DiffAnalyzer::analyze(const std::string& diff_text) {
    static const std::regex file_re(R"(^\+\+\+\s+b/(.+)$)");

    DiffAnalysis result;
    bool has_current = false;

    std::istringstream in(diff_text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (starts_with(line, "+++ ")) {
            std::smatch m;
            if (std::regex_match(line, m, file_re)) {
                std::string path = m[1].str();
                has_current = true;
                auto& files = result.affected_files;
                if (std::find(files.begin(), files.end(), path) == files.end()) {
                    files.push_back(path);
                }
            }
            continue;
        }
        if (!has_current) continue;
        if (starts_with(line, "+++") || starts_with(line, "---") || starts_with(line, "@@")) continue;

        if (starts_with(line, "+")) {
            result.impact.lines_added++;
        } else if (starts_with(line, "-")) {
            result.impact.lines_removed++;
        }
    }

    result.impact.files_changed = static_cast<int>(result.affected_files.size());
    return result;
}

}
