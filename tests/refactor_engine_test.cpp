#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "term_coder/patch/PatchSystem.hpp"
#include "term_coder/refactor/RefactorEngine.hpp"
#include "term_coder/refactor/Renamer.hpp"
#include "test_helpers.hpp"

using term_coder::PatchSystem;
using term_coder::refactor::RefactorEngine;
using term_coder::refactor::TestCounts;
using term_coder::test_support::TempProject;
using term_coder::test_support::quiet_config;

TEST(RefactorEngine, RenamesPythonIdentifiersOnly) {
  TempProject project;
  project.write("mod.py", "foo = 1  # rename foo later\nx = \"foo\"\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo", "bar");

  ASSERT_EQ(plan.changes.count("mod.py"), 1u);
  EXPECT_EQ(plan.changes.at("mod.py"), "bar = 1  # rename foo later\nx = \"foo\"\n");
  ASSERT_EQ(plan.change_stats.size(), 1u);
  EXPECT_EQ(plan.change_stats[0].replacements, 1);
  EXPECT_EQ(plan.change_stats[0].strategy, "token");
  EXPECT_TRUE(plan.safety.ok);
  ASSERT_TRUE(plan.proposal.has_value());
  EXPECT_EQ(plan.proposal->affected_files, std::vector<std::string>{"mod.py"});
  EXPECT_EQ(plan.proposal->instruction, "Rename symbol foo -> bar");
}

TEST(RefactorEngine, PythonFStringsAreLeftAlone) {
  TempProject project;
  project.write("mod.py", "foo = 1\nprint(f\"{foo} items\")\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo", "bar");
  ASSERT_EQ(plan.changes.count("mod.py"), 1u);
  EXPECT_EQ(plan.changes.at("mod.py"), "bar = 1\nprint(f\"{foo} items\")\n");
  EXPECT_EQ(plan.change_stats[0].replacements, 1);
  EXPECT_EQ(plan.change_stats[0].strategy, "token");
}

TEST(RefactorEngine, RenamesCppFieldsAndKeepsFormatting) {
  TempProject project;
  project.write("src/widget.hpp",
                "namespace app {\n"
                "struct Widget {   int count;  };\n"
                "inline int count_of(const Widget& w) { return w.count; } // count stays\n"
                "const char* label = \"count\";\n"
                "}\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("count", "total");
  ASSERT_EQ(plan.changes.count("src/widget.hpp"), 1u);
  EXPECT_EQ(plan.changes.at("src/widget.hpp"),
            "namespace app {\n"
            "struct Widget {   int total;  };\n"
            "inline int count_of(const Widget& w) { return w.total; } // count stays\n"
            "const char* label = \"count\";\n"
            "}\n");
  EXPECT_EQ(plan.safety.total_replacements, 2);
}

TEST(RefactorEngine, SyntaxErrorFallsBackToWholeWordRegex) {
  TempProject project;
  project.write("broken.py", "def foo(:\n    return foo  # foo, food\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo", "bar");
  ASSERT_EQ(plan.changes.count("broken.py"), 1u);
  EXPECT_EQ(plan.changes.at("broken.py"), "def bar(:\n    return bar  # bar, food\n");
  EXPECT_EQ(plan.change_stats[0].strategy, "regex");
  EXPECT_EQ(plan.change_stats[0].replacements, 3);
}

TEST(RefactorEngine, InvalidIdentifierYieldsEmptyPlan) {
  TempProject project;
  project.write("mod.py", "foo = 1\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo-bar", "baz");
  EXPECT_TRUE(plan.changes.empty());
  EXPECT_FALSE(plan.safety.ok);
  EXPECT_FALSE(plan.safety.notes.empty());
  EXPECT_FALSE(plan.proposal.has_value());

  EXPECT_TRUE(engine.rename_symbol("foo", "1abc").changes.empty());
}

TEST(RefactorEngine, StopsPastMaxFiles) {
  TempProject project;
  project.write("a.py", "foo = 1\n");
  project.write("b.py", "foo = 2\n");
  project.write("c.py", "foo = 3\n");
  project.write("d.py", "foo = 4\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo", "bar", {}, {}, 2);
  EXPECT_EQ(plan.changes.size(), 3u);
  EXPECT_EQ(plan.safety.files_changed, 3);
  EXPECT_EQ(plan.safety.max_files_allowed, 2);
  EXPECT_FALSE(plan.safety.ok);
  ASSERT_EQ(plan.safety.notes.size(), 1u);
  EXPECT_NE(plan.safety.notes[0].find("max_files"), std::string::npos);
  EXPECT_EQ(plan.changes.count("d.py"), 0u);
}

TEST(RefactorEngine, HonoursGlobsAndExcludedDirectories) {
  TempProject project;
  project.write("keep.py", "foo = 1\n");
  project.write("vendor/skip.py", "foo = 1\n");
  project.write("build/gen.py", "foo = 1\n");
  project.write("notes.txt", "foo\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo", "bar", {}, {"vendor/*"});
  EXPECT_EQ(plan.changes.size(), 1u);
  EXPECT_EQ(plan.changes.count("keep.py"), 1u);
}

TEST(RefactorEngine, NoMatchesIsNotOk) {
  TempProject project;
  project.write("mod.py", "x = 1\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo", "bar");
  EXPECT_EQ(plan.safety.files_changed, 0);
  EXPECT_FALSE(plan.safety.ok);
}

TEST(RefactorEngine, FailingTestsRollBack) {
  TempProject project;
  const std::string original = "foo = 1\nprint(foo)\n";
  project.write("mod.py", original);
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto plan = engine.rename_symbol("foo", "bar");
  auto result = engine.apply_and_validate(plan, true, [] { return TestCounts{1, 0}; });

  EXPECT_FALSE(result.applied);
  ASSERT_TRUE(result.backup_id.has_value());
  ASSERT_TRUE(result.test_result.has_value());
  EXPECT_EQ(*result.test_result, (TestCounts{1, 0}));
  EXPECT_EQ(project.read("mod.py"), original);
}

TEST(RefactorEngine, FailingTestsRollBackWithBackupsDisabled) {
  TempProject project;
  const std::string original = "foo = 1\nprint(foo)\n";
  project.write("mod.py", original);
  auto cfg = quiet_config();
  cfg.create_backups = false;
  PatchSystem patches(project.root(), cfg);
  RefactorEngine engine(patches);

  auto result = engine.apply_and_validate(engine.rename_symbol("foo", "bar"), true,
                                          [] { return TestCounts{2, 3}; });
  EXPECT_FALSE(result.applied);
  EXPECT_TRUE(result.backup_id.has_value());
  EXPECT_EQ(project.read("mod.py"), original);
}

TEST(RefactorEngine, PassingTestsKeepTheRename) {
  TempProject project;
  project.write("mod.py", "foo = 1\nprint(foo)\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto result = engine.apply_and_validate(engine.rename_symbol("foo", "bar"), true,
                                          [] { return TestCounts{0, 12}; });
  EXPECT_TRUE(result.applied);
  EXPECT_EQ(*result.test_result, (TestCounts{0, 12}));
  EXPECT_EQ(project.read("mod.py"), "bar = 1\nprint(bar)\n");
}

TEST(RefactorEngine, SkippingTestsReportsNoCounts) {
  TempProject project;
  project.write("mod.py", "foo = 1\n");
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  auto result = engine.apply_and_validate(engine.rename_symbol("foo", "bar"), false);
  EXPECT_TRUE(result.applied);
  EXPECT_TRUE(result.backup_id.has_value());
  EXPECT_FALSE(result.test_result.has_value());
}

TEST(RefactorEngine, EmptyPlanIsNotApplied) {
  TempProject project;
  PatchSystem patches(project.root(), quiet_config());
  RefactorEngine engine(patches);

  bool called = false;
  auto result = engine.apply_and_validate(engine.rename_symbol("foo", "bar"), true,
                                          [&called] { called = true; return TestCounts{0, 0}; });
  EXPECT_FALSE(result.applied);
  EXPECT_FALSE(result.backup_id.has_value());
  EXPECT_FALSE(result.test_result.has_value());
  EXPECT_FALSE(called);
}

TEST(Renamer, IdentifierValidation) {
  using term_coder::refactor::is_valid_identifier;
  EXPECT_TRUE(is_valid_identifier("_private"));
  EXPECT_TRUE(is_valid_identifier("Name2"));
  EXPECT_FALSE(is_valid_identifier(""));
  EXPECT_FALSE(is_valid_identifier("2name"));
  EXPECT_FALSE(is_valid_identifier("a.b"));
}
