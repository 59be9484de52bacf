#include "term_coder/patch/FormatterRunner.hpp"
#include "term_coder/config/EngineConfig.hpp"
#include "term_coder/utils/SubProcess.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

namespace term_coder {

namespace fs = std::filesystem;

FormatterRunner::FormatterRunner(const fs::path& root,
                                 std::map<std::string, std::vector<std::string>> formatters)
    : root_(root), formatters_(std::move(formatters)) {}

int FormatterRunner::run(const std::vector<std::string>& relative_paths) const {
    int clean = 0;
    for (const auto& rel : relative_paths) {
        std::string group = EngineConfig::formatter_group(fs::path(rel).extension().string());
        if (group.empty()) continue;

        auto it = formatters_.find(group);
        if (it == formatters_.end()) continue;

        for (const auto& tool : it->second) {
            std::istringstream words(tool);
            std::string exe_name;
            words >> exe_name;
            std::string flags;
            std::getline(words, flags);

            std::string exe = SubProcess::find_executable(exe_name);
            if (exe.empty()) continue;

            std::string cmd = SubProcess::quote(exe) + flags + " " + SubProcess::quote((root_ / rel).string());
            try {
                auto result = SubProcess::run_in(root_, cmd);
                if (result.success) {
                    ++clean;
                } else {
                    spdlog::warn("🧹 Formatter {} exited {} on {}", exe_name, result.exit_code, rel);
                }
            } catch (const std::runtime_error& e) {
                spdlog::warn("🧹 Formatter {} failed on {}: {}", exe_name, rel, e.what());
            }
        }
    }
    return clean;
}

}
