#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace term_coder::validation {

struct TestCaseFailure {
    std::string test_id;   // e.g. tests/test_io.py::test_read
    std::string message;
};

struct TestReport {
    std::string framework;
    std::string command;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    std::vector<TestCaseFailure> failures;
    std::string output;
    int exit_code = 0;

    nlohmann::json to_json() const;
};

// Runs the project's test suite in `root` and scrapes pass/fail counts from
// the combined output. Blocking, no timeout.
class TestRunner {
public:
    explicit TestRunner(const std::filesystem::path& root, std::string command_override = "");

    // "pytest", "jest", "gotest" or "ctest"; "pytest" when nothing matches.
    static std::string detect_framework(const std::filesystem::path& root);
    static std::string default_command(const std::string& framework);

    static TestReport parse_output(const std::string& framework, const std::string& output);

    // Persists the report to <root>/.term-coder/last_test.json.
    TestReport run(const std::optional<std::string>& framework = std::nullopt) const;

    static std::filesystem::path last_report_path(const std::filesystem::path& root);

private:
    std::filesystem::path root_;
    std::string command_override_;

    void persist(const TestReport& report) const;
};

}
