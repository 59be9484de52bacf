#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "term_coder/patch/PatchSystem.hpp"
#include "term_coder/staging/InstructionEditor.hpp"
#include "test_helpers.hpp"

using term_coder::PatchSystem;
using term_coder::staging::InstructionEditor;
using term_coder::test_support::TempProject;
using term_coder::test_support::quiet_config;

class InstructionEditorTest : public ::testing::Test {
protected:
  TempProject project;
  PatchSystem patches{project.root(), quiet_config()};
  InstructionEditor editor{patches};
};

TEST_F(InstructionEditorTest, ReplaceEveryOccurrence) {
  project.write("a.txt", "cat and cat\n");
  auto changes = editor.apply_instruction("Replace 'cat' -> 'dog' in a.txt", {"a.txt"});
  EXPECT_EQ(changes.at("a.txt"), "dog and dog\n");
}

TEST_F(InstructionEditorTest, AppendAddsMissingNewlineFirst) {
  project.write("a.txt", "last");
  project.write("b.txt", "done\n");
  auto changes = editor.apply_instruction("APPEND 'extra'", {"a.txt", "b.txt"});
  EXPECT_EQ(changes.at("a.txt"), "last\nextra\n");
  EXPECT_EQ(changes.at("b.txt"), "done\nextra\n");
}

TEST_F(InstructionEditorTest, Prepend) {
  project.write("a.py", "x = 1\n");
  auto changes = editor.apply_instruction("prepend '# header'", {"a.py"});
  EXPECT_EQ(changes.at("a.py"), "# header\nx = 1\n");
}

TEST_F(InstructionEditorTest, ReplaceWinsOverAppend) {
  project.write("a.txt", "x\n");
  auto changes = editor.apply_instruction("append 'y' then replace 'x' -> 'z'", {"a.txt"});
  EXPECT_EQ(changes.at("a.txt"), "z\n");
}

TEST_F(InstructionEditorTest, OnlyListedFilesInsideRoot) {
  project.write("a.txt", "x\n");
  project.write("b.txt", "x\n");
  auto changes = editor.apply_instruction("replace 'x' -> 'y'", {"a.txt", "../outside.txt"});
  EXPECT_EQ(changes.size(), 1u);
  EXPECT_EQ(changes.count("b.txt"), 0u);
}

TEST_F(InstructionEditorTest, GenerateBuildsPendingEdit) {
  project.write("a.txt", "hello\n");
  auto edit = editor.generate("replace 'hello' -> 'bye'", {"a.txt"});

  ASSERT_TRUE(edit.has_value());
  EXPECT_EQ(edit->instruction, "replace 'hello' -> 'bye'");
  EXPECT_EQ(edit->proposal.rationale, "Applied deterministic transformations based on instruction.");
  EXPECT_EQ(edit->proposal.affected_files, std::vector<std::string>{"a.txt"});
  ASSERT_TRUE(edit->proposal.new_contents.has_value());
  EXPECT_EQ(edit->proposal.new_contents->at("a.txt"), "bye\n");
}

TEST_F(InstructionEditorTest, NoChangeGivesNothing) {
  project.write("a.txt", "hello\n");
  EXPECT_FALSE(editor.generate("replace 'absent' -> 'x'", {"a.txt"}).has_value());
  EXPECT_FALSE(editor.generate("make it better", {"a.txt"}).has_value());
}
