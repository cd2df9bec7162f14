//===- CommandGraph.h - Build rule accumulator ------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the CommandGraph, the structure stages contribute their
// build rules to. The graph indexes every target so that a conflicting
// re-declaration is rejected by the add() call that introduces it, keeps a
// single default target, and serializes the rules to a Makefile.
//
// Example output:
//
// ```make
// # Generated by fabflow. Do not edit.
//
// .DEFAULT_GOAL := top.bit
//
// .PHONY: synth
//
// top.edif: top.src
// 	$(FABFLOW_LAUNCHER) synth_tool top.src
//
// synth: top.edif
// ```
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_FLOW_COMMANDGRAPH_H
#define FABFLOW_FLOW_COMMANDGRAPH_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <vector>

namespace fabflow {

//===----------------------------------------------------------------------===//
// Rule
//===----------------------------------------------------------------------===//

/// One unit of build work.
struct Rule {
  /// Argument vector; empty for pure grouping rules.
  std::vector<std::string> command;

  /// Identifiers produced by the command. Never empty.
  std::vector<std::string> targets;

  /// Identifiers that must be up to date before the command runs.
  std::vector<std::string> dependencies;

  /// Virtual rules produce grouping labels rather than files. The executor
  /// never considers them built because a file of that name exists.
  bool isVirtual = false;

  /// Whether `other` describes the same work: same command, same target and
  /// dependency sets, same kind.
  bool hasSameRecipe(const Rule &other) const;
};

//===----------------------------------------------------------------------===//
// CommandGraph
//===----------------------------------------------------------------------===//

class CommandGraph {
public:
  enum class State { Open, Finalized };

  CommandGraph();
  ~CommandGraph();

  CommandGraph(CommandGraph &&) = default;
  CommandGraph &operator=(CommandGraph &&) = default;

  //===--------------------------------------------------------------------===//
  // Building
  //===--------------------------------------------------------------------===//

  /// Add a rule producing files. Re-adding an identical rule is a no-op.
  /// Names containing `%`, tabs or line breaks, and command arguments
  /// containing line breaks, cannot be written and fail with InvalidRule.
  llvm::Error add(llvm::ArrayRef<std::string> command,
                  llvm::ArrayRef<std::string> targets,
                  llvm::ArrayRef<std::string> dependencies);

  /// Add a rule producing virtual targets.
  llvm::Error addVirtual(llvm::ArrayRef<std::string> command,
                         llvm::ArrayRef<std::string> targets,
                         llvm::ArrayRef<std::string> dependencies);

  /// Declare a file that exists outside the rule set.
  void addSource(llvm::StringRef name);

  /// Choose the target built when none is requested. The choice is final:
  /// repeating it is allowed, changing it is not.
  llvm::Error setDefaultTarget(llvm::StringRef target);

  //===--------------------------------------------------------------------===//
  // Queries
  //===--------------------------------------------------------------------===//

  llvm::ArrayRef<Rule> getRules() const { return rules; }

  /// Return the rule producing `target`, or null.
  const Rule *getRuleForTarget(llvm::StringRef target) const;

  bool isTarget(llvm::StringRef name) const { return targetIndex.count(name); }
  bool isSource(llvm::StringRef name) const { return sources.count(name); }

  bool hasDefaultTarget() const { return !defaultTarget.empty(); }
  llvm::StringRef getDefaultTarget() const { return defaultTarget; }

  State getState() const { return state; }
  bool isFinalized() const { return state == State::Finalized; }

  /// Return the source files `target` transitively depends on, in first-visit
  /// order. Fails with DanglingDependency if an identifier is neither a
  /// target nor a declared source, and with CycleDetected if the rules loop.
  llvm::Expected<std::vector<std::string>>
  getTransitiveSources(llvm::StringRef target) const;

  /// Check that a default target is set and that everything it depends on
  /// resolves.
  llvm::Error verify() const;

  //===--------------------------------------------------------------------===//
  // Serialization
  //===--------------------------------------------------------------------===//

  /// Print the rules as a Makefile. Output depends only on the graph state.
  void print(llvm::raw_ostream &os) const;

  /// Verify the graph and write it to `path`. The file is written to a
  /// temporary in the same directory and renamed into place, so on failure no
  /// output is left behind. On success the graph becomes Finalized.
  llvm::Error write(llvm::StringRef path);

private:
  llvm::Error addRule(Rule rule);

  std::vector<Rule> rules;

  /// Target name to index into `rules`.
  llvm::StringMap<size_t> targetIndex;

  llvm::StringSet<> sources;
  std::string defaultTarget;
  State state = State::Open;
};

/// Quote `arg` for a POSIX shell when it contains anything beyond plain
/// word characters.
std::string quoteShellArgument(llvm::StringRef arg);

} // namespace fabflow

#endif // FABFLOW_FLOW_COMMANDGRAPH_H
