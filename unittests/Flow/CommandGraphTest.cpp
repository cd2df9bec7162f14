//===- CommandGraphTest.cpp - Unit tests for CommandGraph -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "fabflow/Flow/CommandGraph.h"
#include "fabflow/Flow/FlowError.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "gtest/gtest.h"

using namespace fabflow;

namespace {

/// Consume `err` and return its code; success maps to an empty code.
std::error_code codeOf(llvm::Error err) {
  return llvm::errorToErrorCode(std::move(err));
}

std::string messageOf(llvm::Error err) { return llvm::toString(std::move(err)); }

std::string printed(const CommandGraph &graph) {
  std::string text;
  llvm::raw_string_ostream os(text);
  graph.print(os);
  os.flush();
  return text;
}

//===----------------------------------------------------------------------===//
// Rule Accumulation Tests
//===----------------------------------------------------------------------===//

TEST(CommandGraphTest, EmptyGraph) {
  CommandGraph graph;
  EXPECT_TRUE(graph.getRules().empty());
  EXPECT_FALSE(graph.hasDefaultTarget());
  EXPECT_EQ(graph.getState(), CommandGraph::State::Open);
}

TEST(CommandGraphTest, RulesKeepInsertionOrder) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"b_tool"}, {"b"}, {}));
  ASSERT_FALSE(graph.add({"a_tool"}, {"a"}, {"b"}));
  ASSERT_FALSE(graph.addVirtual({}, {"all"}, {"a"}));

  auto rules = graph.getRules();
  ASSERT_EQ(rules.size(), 3u);
  EXPECT_EQ(rules[0].targets[0], "b");
  EXPECT_EQ(rules[1].targets[0], "a");
  EXPECT_EQ(rules[2].targets[0], "all");
  EXPECT_FALSE(rules[1].isVirtual);
  EXPECT_TRUE(rules[2].isVirtual);
}

TEST(CommandGraphTest, IdenticalRuleIsIgnored) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"synth_tool", "top.src"}, {"top.edif"}, {"top.src"}));
  ASSERT_FALSE(graph.add({"synth_tool", "top.src"}, {"top.edif"}, {"top.src"}));
  EXPECT_EQ(graph.getRules().size(), 1u);
}

TEST(CommandGraphTest, IdenticalRuleIgnoresDependencyOrder) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"link"}, {"out"}, {"a.o", "b.o"}));
  ASSERT_FALSE(graph.add({"link"}, {"out"}, {"b.o", "a.o"}));
  EXPECT_EQ(graph.getRules().size(), 1u);
}

TEST(CommandGraphTest, ConflictingCommandFails) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"synth_tool", "top.src"}, {"top.edif"}, {"top.src"}));

  auto err = graph.add({"other_tool", "top.src"}, {"top.edif"}, {"top.src"});
  EXPECT_EQ(codeOf(std::move(err)), FlowErrc::ConflictingRule);
  ASSERT_EQ(graph.getRules().size(), 1u);
  EXPECT_EQ(graph.getRules()[0].command[0], "synth_tool");
}

TEST(CommandGraphTest, ConflictingDependenciesFail) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"tool"}, {"out"}, {"a"}));
  EXPECT_EQ(codeOf(graph.add({"tool"}, {"out"}, {"a", "b"})),
            FlowErrc::ConflictingRule);
}

TEST(CommandGraphTest, ConflictingKindFails) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({}, {"synth"}, {"top.edif"}));
  EXPECT_EQ(codeOf(graph.addVirtual({}, {"synth"}, {"top.edif"})),
            FlowErrc::ConflictingRule);
}

TEST(CommandGraphTest, OverlappingTargetsConflict) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"tool"}, {"a", "b"}, {}));
  auto err = graph.add({"tool"}, {"b"}, {});
  EXPECT_NE(messageOf(std::move(err)).find("'b'"), std::string::npos);
}

TEST(CommandGraphTest, RuleWithoutTargetsIsRejected) {
  CommandGraph graph;
  EXPECT_EQ(codeOf(graph.add({"tool"}, {}, {"x"})), FlowErrc::InvalidRule);
  EXPECT_EQ(codeOf(graph.addVirtual({"tool"}, {""}, {})),
            FlowErrc::InvalidRule);
  EXPECT_TRUE(graph.getRules().empty());
}

TEST(CommandGraphTest, RepeatedTargetsAreCollapsed) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"tool"}, {"out", "out"}, {"in", "in"}));
  const Rule *rule = graph.getRuleForTarget("out");
  ASSERT_NE(rule, nullptr);
  EXPECT_EQ(rule->targets.size(), 1u);
  EXPECT_EQ(rule->dependencies.size(), 1u);
}

TEST(CommandGraphTest, TargetAndSourceQueries) {
  CommandGraph graph;
  graph.addSource("top.src");
  ASSERT_FALSE(graph.add({"tool"}, {"top.edif"}, {"top.src"}));
  EXPECT_TRUE(graph.isTarget("top.edif"));
  EXPECT_FALSE(graph.isTarget("top.src"));
  EXPECT_TRUE(graph.isSource("top.src"));
  EXPECT_EQ(graph.getRuleForTarget("missing"), nullptr);
}

//===----------------------------------------------------------------------===//
// Default Target Tests
//===----------------------------------------------------------------------===//

TEST(CommandGraphTest, DefaultTargetRepeatIsAllowed) {
  CommandGraph graph;
  ASSERT_FALSE(graph.setDefaultTarget("top.bit"));
  EXPECT_FALSE(graph.setDefaultTarget("top.bit"));
  EXPECT_EQ(graph.getDefaultTarget(), "top.bit");
}

TEST(CommandGraphTest, DefaultTargetChangeFails) {
  CommandGraph graph;
  ASSERT_FALSE(graph.setDefaultTarget("top.bit"));
  EXPECT_EQ(codeOf(graph.setDefaultTarget("synth")),
            FlowErrc::DefaultTargetAlreadySet);
  EXPECT_EQ(graph.getDefaultTarget(), "top.bit");
}

TEST(CommandGraphTest, EmptyDefaultTargetIsRejected) {
  CommandGraph graph;
  EXPECT_EQ(codeOf(graph.setDefaultTarget("")), FlowErrc::InvalidRule);
  EXPECT_FALSE(graph.hasDefaultTarget());
}

//===----------------------------------------------------------------------===//
// Dependency Resolution Tests
//===----------------------------------------------------------------------===//

TEST(CommandGraphTest, TransitiveSources) {
  CommandGraph graph;
  graph.addSource("top.src");
  graph.addSource("pins.ucf");
  ASSERT_FALSE(graph.add({"synth_tool", "top.src"}, {"top.edif"}, {"top.src"}));
  ASSERT_FALSE(graph.add({"pnr_tool", "top.edif"}, {"top.bit"},
                         {"top.edif", "pins.ucf", "top.src"}));

  auto sourcesOrErr = graph.getTransitiveSources("top.bit");
  ASSERT_TRUE(static_cast<bool>(sourcesOrErr));
  ASSERT_EQ(sourcesOrErr->size(), 2u);
  EXPECT_EQ((*sourcesOrErr)[0], "top.src");
  EXPECT_EQ((*sourcesOrErr)[1], "pins.ucf");
}

TEST(CommandGraphTest, DanglingDependency) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"pnr_tool"}, {"top.bit"}, {"top.edif"}));

  auto sourcesOrErr = graph.getTransitiveSources("top.bit");
  ASSERT_FALSE(static_cast<bool>(sourcesOrErr));
  std::string message = messageOf(sourcesOrErr.takeError());
  EXPECT_NE(message.find("top.edif"), std::string::npos);
  EXPECT_NE(message.find("top.bit"), std::string::npos);
}

TEST(CommandGraphTest, CycleIsDetected) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"tool"}, {"a"}, {"b"}));
  ASSERT_FALSE(graph.add({"tool"}, {"b"}, {"a"}));

  auto sourcesOrErr = graph.getTransitiveSources("a");
  ASSERT_FALSE(static_cast<bool>(sourcesOrErr));
  EXPECT_EQ(codeOf(sourcesOrErr.takeError()), FlowErrc::CycleDetected);
}

TEST(CommandGraphTest, SharedDependencyIsNotACycle) {
  CommandGraph graph;
  graph.addSource("in");
  ASSERT_FALSE(graph.add({"tool"}, {"common"}, {"in"}));
  ASSERT_FALSE(graph.add({"tool"}, {"left"}, {"common"}));
  ASSERT_FALSE(graph.add({"tool"}, {"right"}, {"common"}));
  ASSERT_FALSE(graph.addVirtual({}, {"all"}, {"left", "right"}));
  ASSERT_FALSE(graph.setDefaultTarget("all"));
  EXPECT_FALSE(graph.verify());
}

TEST(CommandGraphTest, VerifyRequiresDefaultTarget) {
  CommandGraph graph;
  ASSERT_FALSE(graph.addVirtual({}, {"all"}, {}));
  EXPECT_EQ(codeOf(graph.verify()), FlowErrc::MissingDefaultTarget);
}

TEST(CommandGraphTest, VerifyRejectsUnknownDefaultTarget) {
  CommandGraph graph;
  ASSERT_FALSE(graph.setDefaultTarget("top.bit"));
  EXPECT_EQ(codeOf(graph.verify()), FlowErrc::DanglingDependency);
}

//===----------------------------------------------------------------------===//
// Serialization Tests
//===----------------------------------------------------------------------===//

TEST(CommandGraphTest, PrintMakefile) {
  CommandGraph graph;
  graph.addSource("top.src");
  ASSERT_FALSE(graph.add({"synth_tool", "top.src"}, {"top.edif"}, {"top.src"}));
  ASSERT_FALSE(graph.add({"pnr_tool", "top.edif"}, {"top.bit"}, {"top.edif"}));
  ASSERT_FALSE(graph.addVirtual({}, {"synth"}, {"top.edif"}));
  ASSERT_FALSE(graph.setDefaultTarget("top.bit"));

  const char *expected = "# Generated by fabflow. Do not edit.\n"
                         "\n"
                         ".DEFAULT_GOAL := top.bit\n"
                         "\n"
                         ".PHONY: synth\n"
                         "\n"
                         "top.edif: top.src\n"
                         "\t$(FABFLOW_LAUNCHER) synth_tool top.src\n"
                         "\n"
                         "top.bit: top.edif\n"
                         "\t$(FABFLOW_LAUNCHER) pnr_tool top.edif\n"
                         "\n"
                         "synth: top.edif\n";
  EXPECT_EQ(printed(graph), expected);
}

TEST(CommandGraphTest, PrintQuotesArguments) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"yosys", "-p", "tcl top.tcl", "it's", "$HOME", ""},
                         {"out"}, {}));
  std::string text = printed(graph);
  EXPECT_NE(text.find("yosys -p 'tcl top.tcl' 'it'\\''s' '$$HOME' ''"),
            std::string::npos);
}

TEST(CommandGraphTest, PrintEscapesTargets) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"tool"}, {"a b"}, {"c:d", "$x"}));
  EXPECT_NE(printed(graph).find("a\\ b: c\\:d $$x\n"), std::string::npos);
}

TEST(CommandGraphTest, UnwritableNamesAreRejected) {
  CommandGraph graph;
  EXPECT_EQ(codeOf(graph.add({"tool"}, {"%.o"}, {"top.c"})),
            FlowErrc::InvalidRule);
  EXPECT_EQ(codeOf(graph.add({"tool"}, {"top.o"}, {"top\tc"})),
            FlowErrc::InvalidRule);
  EXPECT_EQ(codeOf(graph.addVirtual({}, {"all\nclean"}, {})),
            FlowErrc::InvalidRule);
  EXPECT_TRUE(graph.getRules().empty());
}

TEST(CommandGraphTest, LineBreakInCommandIsRejected) {
  CommandGraph graph;
  llvm::Error err = graph.add({"yosys", "-p", "read top.v\nsynth"},
                              {"top.blif"}, {"top.v"});
  ASSERT_TRUE(static_cast<bool>(err));
  std::string message = messageOf(std::move(err));
  EXPECT_NE(message.find("top.blif"), std::string::npos);
  EXPECT_NE(message.find("\\0A"), std::string::npos);
  EXPECT_FALSE(graph.isTarget("top.blif"));

  // Percent signs are only special in rule lines.
  EXPECT_FALSE(graph.add({"printf", "%s"}, {"top.txt"}, {}));
}

TEST(CommandGraphTest, QuoteShellArgument) {
  EXPECT_EQ(quoteShellArgument("top.v"), "top.v");
  EXPECT_EQ(quoteShellArgument("-mode=batch"), "-mode=batch");
  EXPECT_EQ(quoteShellArgument(""), "''");
  EXPECT_EQ(quoteShellArgument("a b"), "'a b'");
  EXPECT_EQ(quoteShellArgument("a'b"), "'a'\\''b'");
}

TEST(CommandGraphTest, PrintIsDeterministic) {
  auto build = [](CommandGraph &graph) {
    graph.addSource("z.src");
    graph.addSource("a.src");
    ASSERT_FALSE(graph.add({"tool", "z.src"}, {"z.out"}, {"z.src"}));
    ASSERT_FALSE(graph.add({"tool", "a.src"}, {"a.out"}, {"a.src"}));
    ASSERT_FALSE(graph.addVirtual({}, {"all"}, {"z.out", "a.out"}));
    ASSERT_FALSE(graph.setDefaultTarget("all"));
  };
  CommandGraph first, second;
  build(first);
  build(second);
  EXPECT_EQ(printed(first), printed(second));
  EXPECT_EQ(printed(first), printed(first));
}

class CommandGraphWriteTest : public ::testing::Test {
protected:
  void SetUp() override {
    llvm::SmallString<128> tempPath;
    std::error_code ec =
        llvm::sys::fs::createUniqueDirectory("fabflow-graph-test", tempPath);
    ASSERT_FALSE(ec) << "Failed to create temp directory";
    tempDir = tempPath.str().str();
  }

  void TearDown() override {
    if (!tempDir.empty()) {
      llvm::sys::fs::remove_directories(tempDir);
    }
  }

  std::string pathTo(llvm::StringRef name) {
    llvm::SmallString<256> path(tempDir);
    llvm::sys::path::append(path, name);
    return path.str().str();
  }

  static std::string readFile(llvm::StringRef path) {
    auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufferOrErr)
      return "";
    return (*bufferOrErr)->getBuffer().str();
  }

  void populate(CommandGraph &graph) {
    graph.addSource("top.src");
    ASSERT_FALSE(
        graph.add({"synth_tool", "top.src"}, {"top.edif"}, {"top.src"}));
    ASSERT_FALSE(graph.add({"pnr_tool", "top.edif"}, {"top.bit"}, {"top.edif"}));
    ASSERT_FALSE(graph.setDefaultTarget("top.bit"));
  }

  std::string tempDir;
};

TEST_F(CommandGraphWriteTest, WriteFinalizes) {
  CommandGraph graph;
  populate(graph);

  std::string path = pathTo("Makefile");
  ASSERT_FALSE(graph.write(path));
  EXPECT_TRUE(graph.isFinalized());
  EXPECT_EQ(readFile(path), printed(graph));

  EXPECT_EQ(codeOf(graph.add({"tool"}, {"late"}, {})),
            FlowErrc::GraphFinalized);
  EXPECT_EQ(codeOf(graph.setDefaultTarget("late")), FlowErrc::GraphFinalized);
  EXPECT_FALSE(graph.setDefaultTarget("top.bit"));
}

TEST_F(CommandGraphWriteTest, WriteIsDeterministic) {
  CommandGraph first, second;
  populate(first);
  populate(second);

  std::string firstPath = pathTo("first.mk");
  std::string secondPath = pathTo("second.mk");
  ASSERT_FALSE(first.write(firstPath));
  ASSERT_FALSE(second.write(secondPath));
  EXPECT_EQ(readFile(firstPath), readFile(secondPath));
}

TEST_F(CommandGraphWriteTest, WriteRefusesUnverifiedGraph) {
  CommandGraph graph;
  ASSERT_FALSE(graph.add({"pnr_tool"}, {"top.bit"}, {"top.edif"}));
  ASSERT_FALSE(graph.setDefaultTarget("top.bit"));

  std::string path = pathTo("Makefile");
  EXPECT_EQ(codeOf(graph.write(path)), FlowErrc::DanglingDependency);
  EXPECT_FALSE(llvm::sys::fs::exists(path));
  EXPECT_FALSE(graph.isFinalized());
}

TEST_F(CommandGraphWriteTest, WriteReportsPath) {
  CommandGraph graph;
  populate(graph);

  std::string path = pathTo("missing/dir/Makefile");
  llvm::Error err = graph.write(path);
  ASSERT_TRUE(static_cast<bool>(err));
  std::string message;
  std::error_code code;
  llvm::handleAllErrors(std::move(err), [&](const llvm::StringError &e) {
    message = e.getMessage();
    code = e.convertToErrorCode();
  });
  EXPECT_EQ(code, FlowErrc::IOError);
  EXPECT_NE(message.find(path), std::string::npos);
  EXPECT_FALSE(graph.isFinalized());
}

} // namespace
