#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

#include "term_coder/validation/TestRunner.hpp"
#include "test_helpers.hpp"

using term_coder::test_support::TempProject;
using term_coder::validation::TestRunner;

TEST(TestRunner, DetectsFrameworkFromMarkers) {
  TempProject none;
  EXPECT_EQ(TestRunner::detect_framework(none.root()), "pytest");

  TempProject py;
  py.write("tests/test_core.py", "");
  EXPECT_EQ(TestRunner::detect_framework(py.root()), "pytest");

  TempProject js;
  js.write("package.json", "{}");
  EXPECT_EQ(TestRunner::detect_framework(js.root()), "jest");

  TempProject go;
  go.write("go.mod", "module x\n");
  EXPECT_EQ(TestRunner::detect_framework(go.root()), "gotest");

  TempProject cmake;
  cmake.write("CMakeLists.txt", "project(x)\n");
  EXPECT_EQ(TestRunner::detect_framework(cmake.root()), "ctest");

  TempProject mixed;
  mixed.write("CMakeLists.txt", "");
  mixed.write("pyproject.toml", "");
  EXPECT_EQ(TestRunner::detect_framework(mixed.root()), "pytest");
}

TEST(TestRunner, DefaultCommands) {
  EXPECT_EQ(TestRunner::default_command("pytest"), "pytest -q");
  EXPECT_EQ(TestRunner::default_command("jest"), "npm test --silent");
  EXPECT_EQ(TestRunner::default_command("gotest"), "go test ./...");
  EXPECT_EQ(TestRunner::default_command("ctest"), "ctest --test-dir build --output-on-failure");
}

TEST(TestRunner, ParsesPytestSummary) {
  const std::string out =
      "..F.s\n"
      "FAILED tests/test_io.py::test_read - AssertionError: boom\n"
      "=========== 1 failed, 3 passed, 1 skipped in 0.12s ===========\n";
  auto report = TestRunner::parse_output("pytest", out);
  EXPECT_EQ(report.failed, 1);
  EXPECT_EQ(report.passed, 3);
  EXPECT_EQ(report.skipped, 1);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].test_id, "tests/test_io.py::test_read");
  EXPECT_EQ(report.failures[0].message, "AssertionError: boom");
}

TEST(TestRunner, OversizedNumbersInLogLinesAreIgnored) {
  const std::string out =
      "job 20261019072441573 failed to connect\n"
      "1 passed in 0.1s\n";
  auto report = TestRunner::parse_output("pytest", out);
  EXPECT_EQ(report.failed, 0);
  EXPECT_EQ(report.passed, 1);

  auto ctest = TestRunner::parse_output("ctest", "0% tests passed, 99999999999 tests failed out of 99999999999\n");
  EXPECT_EQ(ctest.failed, 0);
  EXPECT_EQ(ctest.passed, 0);
}

TEST(TestRunner, ParsesJestFailedSuites) {
  const std::string out = "PASS src/a.test.js\nFAIL src/b.test.js\n  FAIL src/c.test.js\n";
  auto report = TestRunner::parse_output("jest", out);
  EXPECT_EQ(report.failed, 2);
  ASSERT_EQ(report.failures.size(), 2u);
  EXPECT_EQ(report.failures[0].test_id, "src/b.test.js");
}

TEST(TestRunner, ParsesGoTestLines) {
  const std::string out =
      "--- FAIL: TestParse (0.00s)\n"
      "FAIL\n"
      "PASS\n"
      "SKIP\n";
  auto report = TestRunner::parse_output("gotest", out);
  EXPECT_EQ(report.failed, 1);
  EXPECT_EQ(report.passed, 1);
  EXPECT_EQ(report.skipped, 1);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].test_id, "TestParse");
}

TEST(TestRunner, ParsesCtestSummary) {
  const std::string out =
      "67% tests passed, 1 tests failed out of 3\n"
      "\n"
      "The following tests FAILED:\n"
      "\t  2 - parser_test (Failed)\n";
  auto report = TestRunner::parse_output("ctest", out);
  EXPECT_EQ(report.failed, 1);
  EXPECT_EQ(report.passed, 2);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].test_id, "parser_test");
  EXPECT_EQ(report.failures[0].message, "Failed");
}

TEST(TestRunner, RunsOverrideCommandAndPersistsReport) {
  TempProject project;
  project.write("pytest.ini", "");
  TestRunner runner(project.root(), "echo '2 failed, 5 passed'; exit 1");

  auto report = runner.run();
  EXPECT_EQ(report.framework, "pytest");
  EXPECT_EQ(report.failed, 2);
  EXPECT_EQ(report.passed, 5);
  EXPECT_EQ(report.exit_code, 1);

  std::ifstream saved(TestRunner::last_report_path(project.root()));
  ASSERT_TRUE(saved.is_open());
  auto j = nlohmann::json::parse(saved);
  EXPECT_EQ(j.at("failed").get<int>(), 2);
  EXPECT_EQ(j.at("command").get<std::string>(), "echo '2 failed, 5 passed'; exit 1");
}
