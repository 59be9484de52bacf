#pragma once
#include <map>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "term_coder/patch/PatchTypes.hpp"

namespace term_coder {

// Project settings from <root>/.term-coder/config.json merged over defaults.
struct EngineConfig {
    bool create_backups = true;
    SafetyThresholds thresholds;

    // Formatter group ("python", "javascript", "go", "cpp") -> commands.
    // A command may carry flags ("clang-format -i"); the file path is appended.
    std::map<std::string, std::vector<std::string>> formatters = {
        {"python", {"black", "isort"}},
        {"javascript", {"prettier"}},
        {"go", {"gofmt"}},
        {"cpp", {"clang-format -i"}}
    };

    int refactor_max_files = 200;
    std::string test_command;   // empty: detect from the project layout
    std::string log_level = "info";

    static std::filesystem::path config_path(const std::filesystem::path& root);

    // Missing file -> defaults. Malformed JSON -> defaults plus a warning.
    static EngineConfig load(const std::filesystem::path& root);

    static EngineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    void save(const std::filesystem::path& root) const;

    // Formatter group for a file extension ("py", "tsx", ...); empty if none.
    static std::string formatter_group(const std::string& extension);
};

// Applies `logging.level` to the spdlog default logger.
void configure_logging(const EngineConfig& config);

}
