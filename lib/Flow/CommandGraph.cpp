//===- CommandGraph.cpp - Build rule accumulator --------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements rule accumulation, dependency resolution and Makefile
// serialization for the CommandGraph.
//
//===----------------------------------------------------------------------===//

#include "fabflow/Flow/CommandGraph.h"
#include "fabflow/Flow/FlowError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

#define DEBUG_TYPE "fabflow-command-graph"

using namespace fabflow;

//===----------------------------------------------------------------------===//
// Rule
//===----------------------------------------------------------------------===//

static std::vector<std::string> sorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  return values;
}

bool Rule::hasSameRecipe(const Rule &other) const {
  return isVirtual == other.isVirtual && command == other.command &&
         sorted(targets) == sorted(other.targets) &&
         sorted(dependencies) == sorted(other.dependencies);
}

/// Drop repeated entries, keeping the first occurrence of each.
static std::vector<std::string> uniqued(llvm::ArrayRef<std::string> values) {
  std::vector<std::string> result;
  llvm::StringSet<> seen;
  for (const auto &value : values)
    if (seen.insert(value).second)
      result.push_back(value);
  return result;
}

//===----------------------------------------------------------------------===//
// Makefile Escaping
//===----------------------------------------------------------------------===//

static bool isShellSafe(char c) {
  return llvm::isAlnum(c) || llvm::StringRef("@%+=:,./-_").contains(c);
}

std::string fabflow::quoteShellArgument(llvm::StringRef arg) {
  if (arg.empty())
    return "''";
  if (llvm::all_of(arg, isShellSafe))
    return arg.str();

  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

/// Make expands `$` in both rule lines and recipes.
static std::string escapeDollars(llvm::StringRef text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (c == '$')
      result += '$';
    result += c;
  }
  return result;
}

static std::string escapeMakeTarget(llvm::StringRef name) {
  std::string result;
  result.reserve(name.size());
  for (char c : name) {
    switch (c) {
    case '$':
      result += "$$";
      break;
    case ' ':
    case '#':
    case ':':
      result += '\\';
      result += c;
      break;
    default:
      result += c;
    }
  }
  return result;
}

/// Make has no escape for these in rule lines: `%` turns the rule into a
/// pattern rule and line breaks end it.
static bool isUnescapableInName(char c) {
  return c == '%' || c == '\t' || c == '\n' || c == '\r';
}

/// A line break inside a recipe argument ends the recipe line.
static bool isUnescapableInRecipe(char c) { return c == '\n' || c == '\r'; }

static std::string printable(llvm::StringRef text) {
  std::string result;
  llvm::raw_string_ostream os(result);
  llvm::printEscapedString(text, os);
  return os.str();
}

static llvm::Error checkRuleText(const Rule &rule) {
  for (const auto *names : {&rule.targets, &rule.dependencies})
    for (const auto &name : *names)
      if (llvm::any_of(name, isUnescapableInName))
        return createFlowError(FlowErrc::InvalidRule,
                               "'%s' cannot be written as a make target or "
                               "dependency",
                               printable(name).c_str());
  for (const auto &arg : rule.command)
    if (llvm::any_of(arg, isUnescapableInRecipe))
      return createFlowError(FlowErrc::InvalidRule,
                             "command argument '%s' for '%s' contains a line "
                             "break",
                             printable(arg).c_str(),
                             rule.targets.front().c_str());
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// CommandGraph - Building
//===----------------------------------------------------------------------===//

CommandGraph::CommandGraph() = default;
CommandGraph::~CommandGraph() = default;

llvm::Error CommandGraph::add(llvm::ArrayRef<std::string> command,
                              llvm::ArrayRef<std::string> targets,
                              llvm::ArrayRef<std::string> dependencies) {
  Rule rule;
  rule.command = command.vec();
  rule.targets = uniqued(targets);
  rule.dependencies = uniqued(dependencies);
  return addRule(std::move(rule));
}

llvm::Error CommandGraph::addVirtual(llvm::ArrayRef<std::string> command,
                                     llvm::ArrayRef<std::string> targets,
                                     llvm::ArrayRef<std::string> dependencies) {
  Rule rule;
  rule.command = command.vec();
  rule.targets = uniqued(targets);
  rule.dependencies = uniqued(dependencies);
  rule.isVirtual = true;
  return addRule(std::move(rule));
}

llvm::Error CommandGraph::addRule(Rule rule) {
  if (rule.targets.empty())
    return createFlowError(FlowErrc::InvalidRule,
                           "rule has no targets (command: '%s')",
                           llvm::join(rule.command, " ").c_str());
  if (llvm::is_contained(rule.targets, ""))
    return createFlowError(FlowErrc::InvalidRule,
                           "rule has an empty target name");
  if (auto err = checkRuleText(rule))
    return err;

  if (isFinalized())
    return createFlowError(FlowErrc::GraphFinalized,
                           "cannot add rule for '%s' after the graph was "
                           "written",
                           rule.targets.front().c_str());

  // Every target that already exists must belong to an identical rule. Since
  // identical rules have identical target sets, one match covers all targets.
  for (const auto &target : rule.targets) {
    auto it = targetIndex.find(target);
    if (it == targetIndex.end())
      continue;
    if (!rules[it->second].hasSameRecipe(rule))
      return createFlowError(FlowErrc::ConflictingRule,
                             "conflicting rules for target '%s'",
                             target.c_str());
    LLVM_DEBUG(llvm::dbgs() << "Ignoring repeated rule for '" << target
                            << "'\n");
    return llvm::Error::success();
  }

  LLVM_DEBUG(llvm::dbgs() << "Adding " << (rule.isVirtual ? "virtual " : "")
                          << "rule #" << rules.size() << " for '"
                          << llvm::join(rule.targets, " ") << "'\n");

  for (const auto &target : rule.targets)
    targetIndex[target] = rules.size();
  rules.push_back(std::move(rule));
  return llvm::Error::success();
}

void CommandGraph::addSource(llvm::StringRef name) { sources.insert(name); }

llvm::Error CommandGraph::setDefaultTarget(llvm::StringRef target) {
  if (target.empty())
    return createFlowError(FlowErrc::InvalidRule,
                           "default target must not be empty");
  if (defaultTarget == target)
    return llvm::Error::success();

  if (isFinalized())
    return createFlowError(FlowErrc::GraphFinalized,
                           "cannot set default target '%s' after the graph "
                           "was written",
                           target.str().c_str());
  if (hasDefaultTarget())
    return createFlowError(FlowErrc::DefaultTargetAlreadySet,
                           "default target already set to '%s', cannot "
                           "change it to '%s'",
                           defaultTarget.c_str(), target.str().c_str());

  LLVM_DEBUG(llvm::dbgs() << "Default target: '" << target << "'\n");
  defaultTarget = target.str();
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// CommandGraph - Queries
//===----------------------------------------------------------------------===//

const Rule *CommandGraph::getRuleForTarget(llvm::StringRef target) const {
  auto it = targetIndex.find(target);
  if (it == targetIndex.end())
    return nullptr;
  return &rules[it->second];
}

namespace {

/// Depth-first walk from a target down to the sources it needs.
struct SourceCollector {
  explicit SourceCollector(const CommandGraph &graph) : graph(graph) {}

  llvm::Error visit(llvm::StringRef id, llvm::StringRef requiredBy);

  const CommandGraph &graph;

  /// Targets seen so far; true while the target is on the DFS stack.
  llvm::StringMap<bool> active;

  llvm::StringSet<> seenSources;
  std::vector<std::string> found;
};

} // namespace

llvm::Error SourceCollector::visit(llvm::StringRef id,
                                   llvm::StringRef requiredBy) {
  if (const Rule *rule = graph.getRuleForTarget(id)) {
    auto it = active.find(id);
    if (it != active.end()) {
      if (it->second)
        return createFlowError(FlowErrc::CycleDetected,
                               "dependency cycle through target '%s'",
                               id.str().c_str());
      return llvm::Error::success();
    }

    active[id] = true;
    for (const auto &dep : rule->dependencies)
      if (auto err = visit(dep, id))
        return err;
    active[id] = false;
    return llvm::Error::success();
  }

  if (graph.isSource(id)) {
    if (seenSources.insert(id).second)
      found.push_back(id.str());
    return llvm::Error::success();
  }

  if (requiredBy.empty())
    return createFlowError(FlowErrc::DanglingDependency,
                           "'%s' is neither a rule target nor a source file",
                           id.str().c_str());
  return createFlowError(FlowErrc::DanglingDependency,
                         "'%s' (required by '%s') is neither a rule target "
                         "nor a source file",
                         id.str().c_str(), requiredBy.str().c_str());
}

llvm::Expected<std::vector<std::string>>
CommandGraph::getTransitiveSources(llvm::StringRef target) const {
  SourceCollector collector(*this);
  if (auto err = collector.visit(target, ""))
    return std::move(err);
  return std::move(collector.found);
}

llvm::Error CommandGraph::verify() const {
  if (!hasDefaultTarget())
    return createFlowError(FlowErrc::MissingDefaultTarget,
                           "no default target has been set");
  auto sourcesOrErr = getTransitiveSources(defaultTarget);
  if (!sourcesOrErr)
    return sourcesOrErr.takeError();
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// CommandGraph - Serialization
//===----------------------------------------------------------------------===//

void CommandGraph::print(llvm::raw_ostream &os) const {
  os << "# Generated by fabflow. Do not edit.\n";

  if (hasDefaultTarget())
    os << "\n.DEFAULT_GOAL := " << escapeMakeTarget(defaultTarget) << "\n";

  llvm::SmallVector<std::string, 8> phony;
  for (const auto &rule : rules)
    if (rule.isVirtual)
      for (const auto &target : rule.targets)
        phony.push_back(escapeMakeTarget(target));
  if (!phony.empty())
    os << "\n.PHONY: " << llvm::join(phony, " ") << "\n";

  for (const auto &rule : rules) {
    os << "\n";
    llvm::interleave(
        rule.targets, os,
        [&](const std::string &target) { os << escapeMakeTarget(target); },
        " ");
    os << ":";
    for (const auto &dep : rule.dependencies)
      os << " " << escapeMakeTarget(dep);
    os << "\n";

    if (rule.command.empty())
      continue;
    os << "\t$(FABFLOW_LAUNCHER)";
    for (const auto &arg : rule.command)
      os << " " << escapeDollars(quoteShellArgument(arg));
    os << "\n";
  }
}

llvm::Error CommandGraph::write(llvm::StringRef path) {
  if (auto err = verify())
    return err;

  std::string text;
  llvm::raw_string_ostream textStream(text);
  print(textStream);
  textStream.flush();

  llvm::SmallString<256> model(path);
  model += ".tmp-%%%%%%";
  auto tempOrErr = llvm::sys::fs::TempFile::create(model);
  if (!tempOrErr)
    return createFlowError(FlowErrc::IOError, "cannot write '%s': %s",
                           path.str().c_str(),
                           llvm::toString(tempOrErr.takeError()).c_str());

  {
    llvm::raw_fd_ostream os(tempOrErr->FD, /*shouldClose=*/false);
    os << text;
    os.flush();
    if (os.has_error()) {
      std::string reason = os.error().message();
      os.clear_error();
      llvm::consumeError(tempOrErr->discard());
      return createFlowError(FlowErrc::IOError, "cannot write '%s': %s",
                             path.str().c_str(), reason.c_str());
    }
  }

  if (auto err = tempOrErr->keep(path))
    return createFlowError(FlowErrc::IOError, "cannot write '%s': %s",
                           path.str().c_str(),
                           llvm::toString(std::move(err)).c_str());

  LLVM_DEBUG(llvm::dbgs() << "Wrote " << rules.size() << " rules to '" << path
                          << "'\n");
  state = State::Finalized;
  return llvm::Error::success();
}
