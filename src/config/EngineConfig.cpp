#include "term_coder/config/EngineConfig.hpp"
#include "term_coder/Errors.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace term_coder {

namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path EngineConfig::config_path(const fs::path& root) {
    return root / ".term-coder" / "config.json";
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;

    if (j.contains("safety") && j["safety"].is_object()) {
        const auto& s = j["safety"];
        cfg.create_backups = s.value("create_backups", cfg.create_backups);
        cfg.thresholds.max_files = s.value("max_files", cfg.thresholds.max_files);
        cfg.thresholds.max_lines = s.value("max_lines", cfg.thresholds.max_lines);
    }

    // Groups present in the file replace the default list for that group
    if (j.contains("formatters") && j["formatters"].is_object()) {
        for (const auto& [group, tools] : j["formatters"].items()) {
            cfg.formatters[group] = tools.get<std::vector<std::string>>();
        }
    }

    if (j.contains("refactor") && j["refactor"].is_object()) {
        cfg.refactor_max_files = j["refactor"].value("max_files", cfg.refactor_max_files);
    }
    if (j.contains("testing") && j["testing"].is_object()) {
        cfg.test_command = j["testing"].value("command", cfg.test_command);
    }
    if (j.contains("logging") && j["logging"].is_object()) {
        cfg.log_level = j["logging"].value("level", cfg.log_level);
    }

    if (cfg.thresholds.max_files <= 0 || cfg.thresholds.max_lines <= 0) {
        spdlog::warn("⚠️ Non-positive safety thresholds in config; using defaults.");
        cfg.thresholds = SafetyThresholds{};
    }
    return cfg;
}

json EngineConfig::to_json() const {
    return {
        {"safety", {
            {"create_backups", create_backups},
            {"max_files", thresholds.max_files},
            {"max_lines", thresholds.max_lines}
        }},
        {"formatters", formatters},
        {"refactor", {{"max_files", refactor_max_files}}},
        {"testing", {{"command", test_command}}},
        {"logging", {{"level", log_level}}}
    };
}

EngineConfig EngineConfig::load(const fs::path& root) {
    fs::path path = config_path(root);
    std::error_code ec;
    if (!fs::exists(path, ec)) return EngineConfig{};

    try {
        std::ifstream f(path);
        auto j = json::parse(f);
        return from_json(j);
    } catch (const json::exception& e) {
        spdlog::warn("❌ Failed to parse {}: {}. Using defaults.", path.string(), e.what());
    }
    return EngineConfig{};
}

void EngineConfig::save(const fs::path& root) const {
    fs::path path = config_path(root);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) throw PatchIoError("cannot create " + path.parent_path().string() + ": " + ec.message());

    std::ofstream o(path, std::ios::trunc);
    if (!o.is_open()) throw PatchIoError("cannot write " + path.string());
    o << to_json().dump(2);
}

std::string EngineConfig::formatter_group(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);

    if (ext == "py") return "python";
    if (ext == "js" || ext == "ts" || ext == "jsx" || ext == "tsx") return "javascript";
    if (ext == "go") return "go";
    if (ext == "c" || ext == "cc" || ext == "cpp" || ext == "cxx" ||
        ext == "h" || ext == "hh" || ext == "hpp") return "cpp";
    return "";
}

void configure_logging(const EngineConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("⚠️ Unknown log level '{}', keeping info", config.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

}
