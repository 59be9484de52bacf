#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "term_coder/patch/DiffAnalyzer.hpp"
#include "term_coder/patch/DiffBuilder.hpp"
#include "test_helpers.hpp"

using term_coder::DiffAnalyzer;
using term_coder::DiffBuilder;
using term_coder::test_support::TempProject;

TEST(DiffAnalyzer, NewFileRoundTrip) {
  TempProject project;
  DiffBuilder builder(project.root());
  const std::string content = "def f():\n    return 1\n\nprint(f())\n";

  auto analysis = DiffAnalyzer::analyze(builder.build({{"src/mod.py", content}}));
  EXPECT_EQ(analysis.affected_files, std::vector<std::string>{"src/mod.py"});
  EXPECT_EQ(analysis.impact.lines_added, 4);
  EXPECT_EQ(analysis.impact.lines_removed, 0);
  EXPECT_EQ(analysis.impact.files_changed, 1);
}

TEST(DiffAnalyzer, CountsAcrossSections) {
  const std::string diff =
      "--- a/a.txt\n+++ b/a.txt\n@@ -1,2 +1,2 @@\n-old\n+new\n same\n"
      "\n"
      "--- a/b.txt\n+++ b/b.txt\n@@ -1 +0,0 @@\n-gone\n\\ No newline at end of file";

  auto analysis = DiffAnalyzer::analyze(diff);
  EXPECT_EQ(analysis.affected_files, (std::vector<std::string>{"a.txt", "b.txt"}));
  EXPECT_EQ(analysis.impact.files_changed, 2);
  EXPECT_EQ(analysis.impact.lines_added, 1);
  EXPECT_EQ(analysis.impact.lines_removed, 2);
}

TEST(DiffAnalyzer, DeduplicatesInFirstAppearanceOrder) {
  const std::string diff =
      "+++ b/z.txt\n+1\n"
      "+++ b/a.txt\n+2\n"
      "+++ b/z.txt\n+3\n";
  auto analysis = DiffAnalyzer::analyze(diff);
  EXPECT_EQ(analysis.affected_files, (std::vector<std::string>{"z.txt", "a.txt"}));
  EXPECT_EQ(analysis.impact.lines_added, 3);
}

TEST(DiffAnalyzer, IgnoresPreambleAndCarriageReturns) {
  const std::string diff =
      "+ not counted\n"
      "- not counted\n"
      "--- a/w.txt\r\n+++ b/w.txt\r\n@@ -1 +1 @@\r\n-a\r\n+b\r\n";
  auto analysis = DiffAnalyzer::analyze(diff);
  EXPECT_EQ(analysis.affected_files, std::vector<std::string>{"w.txt"});
  EXPECT_EQ(analysis.impact.lines_added, 1);
  EXPECT_EQ(analysis.impact.lines_removed, 1);
}

TEST(DiffAnalyzer, EmptyDiff) {
  auto analysis = DiffAnalyzer::analyze("");
  EXPECT_TRUE(analysis.affected_files.empty());
  EXPECT_EQ(analysis.impact, term_coder::ImpactAssessment{});
}
