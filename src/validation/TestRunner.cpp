#include "term_coder/validation/TestRunner.hpp"
#include "term_coder/utils/FileSystemTools.hpp"
#include "term_coder/utils/SubProcess.hpp"
#include "term_coder/Errors.hpp"
#include <regex>
#include <charconv>
#include <algorithm>
#include <sstream>
#include <spdlog/spdlog.h>

namespace term_coder::validation {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Digit runs that do not fit an int are not counts
bool parse_count(const std::string& digits, int& out) {
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, out);
    return ec == std::errc() && ptr == end;
}

void parse_pytest(const std::string& out, TestReport& report) {
    // Summary: "2 failed, 10 passed, 1 skipped in 0.12s"; the last mention of a kind wins
    static const std::regex summary(R"((\d+)\s+(failed|passed|skipped))");
    for (auto it = std::sregex_iterator(out.begin(), out.end(), summary);
         it != std::sregex_iterator(); ++it) {
        int n = 0;
        if (!parse_count((*it)[1].str(), n)) continue;
        std::string kind = (*it)[2].str();
        if (kind == "failed") report.failed = n;
        else if (kind == "passed") report.passed = n;
        else report.skipped = n;
    }

    static const std::regex failed_line(R"(^FAILED\s+(.+?)\s+-\s+(.*)$)");
    std::istringstream lines(out);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch m;
        std::string t = trim(line);
        if (std::regex_match(t, m, failed_line)) {
            report.failures.push_back({m[1].str(), m[2].str()});
        }
    }
}

void parse_jest(const std::string& out, TestReport& report) {
    std::istringstream lines(out);
    std::string line;
    while (std::getline(lines, line)) {
        std::string t = trim(line);
        if (starts_with(t, "FAIL ")) {
            report.failures.push_back({t.substr(5), "Failed suite"});
            report.failed++;
        }
    }
}

void parse_go(const std::string& out, TestReport& report) {
    std::istringstream lines(out);
    std::string line;
    while (std::getline(lines, line)) {
        if (starts_with(line, "--- FAIL:")) {
            std::istringstream words(line);
            std::string dashes, tag, name;
            words >> dashes >> tag >> name;
            if (!name.empty()) report.failures.push_back({name, ""});
            report.failed++;
        }
        if (starts_with(line, "PASS")) report.passed++;
        if (starts_with(line, "SKIP")) report.skipped++;
    }
}

void parse_ctest(const std::string& out, TestReport& report) {
    static const std::regex summary(R"((\d+)% tests passed, (\d+) tests? failed out of (\d+))");
    std::smatch m;
    int failed = 0;
    int total = 0;
    if (std::regex_search(out, m, summary) && parse_count(m[2].str(), failed) && parse_count(m[3].str(), total)) {
        report.failed = failed;
        report.passed = std::max(0, total - failed);
    }

    // "  3 - parser_test (Failed)"
    static const std::regex failed_line(R"(^\s*\d+\s+-\s+(\S+)\s+\((.+)\)\s*$)");
    std::istringstream lines(out);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch fm;
        if (std::regex_match(line, fm, failed_line)) {
            report.failures.push_back({fm[1].str(), fm[2].str()});
        }
    }
}

}

json TestReport::to_json() const {
    json fails = json::array();
    for (const auto& f : failures) {
        fails.push_back({{"test_id", f.test_id}, {"message", f.message}});
    }
    return {
        {"framework", framework},
        {"command", command},
        {"passed", passed},
        {"failed", failed},
        {"skipped", skipped},
        {"failures", fails},
        {"exit_code", exit_code}
    };
}

TestRunner::TestRunner(const fs::path& root, std::string command_override)
    : root_(FileSystemTools::normalize_root(root)), command_override_(std::move(command_override)) {}

std::string TestRunner::detect_framework(const fs::path& root) {
    std::error_code ec;
    auto has = [&](const char* name) { return fs::exists(root / name, ec); };

    if (has("pyproject.toml") || has("pytest.ini")) return "pytest";
    if (fs::is_directory(root / "tests", ec)) {
        for (const auto& entry : fs::directory_iterator(root / "tests", ec)) {
            std::string name = entry.path().filename().string();
            if (FileSystemTools::glob_match("test_*.py", name)) return "pytest";
        }
    }
    if (has("package.json") || has("jest.config.js")) return "jest";
    if (has("go.mod")) return "gotest";
    if (has("CMakeLists.txt")) return "ctest";
    return "pytest";
}

std::string TestRunner::default_command(const std::string& framework) {
    if (framework == "jest") return "npm test --silent";
    if (framework == "gotest") return "go test ./...";
    if (framework == "ctest") return "ctest --test-dir build --output-on-failure";
    return "pytest -q";
}

TestReport TestRunner::parse_output(const std::string& framework, const std::string& output) {
    TestReport report;
    report.framework = framework;
    if (framework == "pytest") parse_pytest(output, report);
    else if (framework == "jest") parse_jest(output, report);
    else if (framework == "gotest") parse_go(output, report);
    else if (framework == "ctest") parse_ctest(output, report);
    return report;
}

TestReport TestRunner::run(const std::optional<std::string>& framework) const {
    std::string fw = framework ? *framework : detect_framework(root_);
    std::string command = command_override_.empty() ? default_command(fw) : command_override_;

    spdlog::info("🧪 Running tests ({}): {}", fw, command);
    ProcessResult proc;
    try {
        proc = SubProcess::run_in(root_, command);
    } catch (const std::runtime_error& e) {
        spdlog::error("❌ Could not start test command: {}", e.what());
        proc = {e.what(), -1, false};
    }

    TestReport report = parse_output(fw, proc.output);
    report.command = command;
    report.output = proc.output;
    report.exit_code = proc.exit_code;

    spdlog::info("🧪 {} passed, {} failed, {} skipped (exit {})",
                 report.passed, report.failed, report.skipped, report.exit_code);
    persist(report);
    return report;
}

fs::path TestRunner::last_report_path(const fs::path& root) {
    return root / ".term-coder" / "last_test.json";
}

void TestRunner::persist(const TestReport& report) const {
    fs::path path = last_report_path(root_);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    try {
        FileSystemTools::write_file(path, report.to_json().dump(2));
    } catch (const PatchIoError& e) {
        spdlog::warn("⚠️ Could not save test report: {}", e.what());
    }
}

}
