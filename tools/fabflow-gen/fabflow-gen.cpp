//===- fabflow-gen.cpp - Build script generator ---------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the 'fabflow-gen' tool. It reads a project
// configuration, instantiates the requested flow and writes the resulting
// command graph as a Makefile into the work root.
//
// Usage:
//   fabflow-gen                          (uses ./fabflow.yaml)
//   fabflow-gen blinky.yaml -flow-option synth=yosys
//   fabflow-gen -list-flows
//
//===----------------------------------------------------------------------===//

#include "fabflow/Flow/CommandGraph.h"
#include "fabflow/Flow/FlowGraph.h"
#include "fabflow/Stages/BuiltinFlows.h"
#include "fabflow/Support/ProjectConfig.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

namespace cl = llvm::cl;
using namespace fabflow;

//===----------------------------------------------------------------------===//
// Command-line Options
//===----------------------------------------------------------------------===//

static cl::OptionCategory mainCategory("fabflow-gen Options");

static cl::opt<std::string> configFile(cl::Positional,
                                       cl::desc("[project config]"),
                                       cl::init(""), cl::cat(mainCategory));

static cl::opt<std::string> flowName("flow",
                                     cl::desc("Flow to instantiate (overrides "
                                              "project.flow)"),
                                     cl::value_desc("name"), cl::init(""),
                                     cl::cat(mainCategory));

static cl::opt<std::string> outputFile("o",
                                       cl::desc("Output Makefile (default: "
                                                "<work root>/Makefile)"),
                                       cl::value_desc("filename"),
                                       cl::init(""), cl::cat(mainCategory));

static cl::opt<std::string>
    workRoot("work-root",
             cl::desc("Build directory (overrides project.work_root)"),
             cl::value_desc("dir"), cl::init(""), cl::cat(mainCategory));

static cl::list<std::string>
    flowOptions("flow-option", cl::desc("Set a flow option"),
                cl::value_desc("key=value"), cl::cat(mainCategory));

static cl::list<std::string>
    globalOptions("option", cl::desc("Set an option for every stage"),
                  cl::value_desc("key=value"), cl::cat(mainCategory));

static cl::opt<bool> listFlows("list-flows",
                               cl::desc("List the available flows and exit"),
                               cl::init(false), cl::cat(mainCategory));

static cl::opt<bool> verbose("v", cl::desc("Print progress information"),
                             cl::init(false), cl::cat(mainCategory));

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static void printFlows(const StageRegistry &registry) {
  for (const auto &name : registry.getFlowNames()) {
    const FlowDescriptor *flow = registry.getFlow(name);
    llvm::outs() << name;
    if (!flow->description.empty())
      llvm::outs() << " - " << flow->description;
    llvm::outs() << "\n  stages:";
    for (const auto &stage : flow->stages)
      llvm::outs() << " " << stage.toolId;
    llvm::outs() << "\n";
    for (const auto &option : flow->options)
      llvm::outs() << "  " << option.name << ": " << option.description
                   << "\n";
  }
}

static llvm::Expected<std::unique_ptr<ProjectConfig>> loadConfig() {
  if (!configFile.empty())
    return ProjectConfig::loadFromFile(configFile);

  llvm::SmallString<256> cwd;
  if (auto ec = llvm::sys::fs::current_path(cwd))
    return llvm::createStringError(ec, "cannot determine current directory");
  return ProjectConfig::findAndLoad(cwd);
}

/// Apply command-line overrides on top of the loaded configuration.
static void applyOverrides(ProjectConfig &config) {
  ProjectInfo info = config.getProjectInfo();
  if (!flowName.empty())
    info.flow = flowName;
  if (!workRoot.empty()) {
    llvm::SmallString<256> absPath(workRoot);
    llvm::sys::fs::make_absolute(absPath);
    info.workRoot = absPath.str().str();
  }
  config.setProjectInfo(info);

  for (const auto &assignment : flowOptions) {
    auto kv = parseAssignment(assignment);
    config.setFlowOption(kv.first, kv.second);
  }
  for (const auto &assignment : globalOptions) {
    auto kv = parseAssignment(assignment);
    config.setOption(kv.first, kv.second);
  }
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

static int execute() {
  const StageRegistry &registry = stages::getBuiltinRegistry();
  if (listFlows) {
    printFlows(registry);
    return 0;
  }

  auto configOrErr = loadConfig();
  if (!configOrErr) {
    llvm::errs() << "Error: " << llvm::toString(configOrErr.takeError())
                 << "\n";
    return 1;
  }
  ProjectConfig &config = **configOrErr;
  applyOverrides(config);
  if (auto err = config.validate()) {
    llvm::errs() << "Error: " << llvm::toString(std::move(err)) << "\n";
    return 1;
  }

  const ProjectInfo &info = config.getProjectInfo();
  if (verbose)
    llvm::outs() << "Instantiating flow '" << info.flow << "' for project '"
                 << info.name << "'\n";

  auto graphOrErr = buildCommandGraph(registry, info.flow,
                                      config.getProjectMetadata(),
                                      config.getFlowConfig());
  if (!graphOrErr) {
    llvm::errs() << "Error: " << llvm::toString(graphOrErr.takeError())
                 << "\n";
    return 1;
  }

  std::string root = config.getWorkRoot();
  std::string output = outputFile;
  if (output.empty()) {
    if (auto ec = llvm::sys::fs::create_directories(root)) {
      llvm::errs() << "Error: cannot create work root '" << root
                   << "': " << ec.message() << "\n";
      return 1;
    }
    llvm::SmallString<256> path(root);
    llvm::sys::path::append(path, "Makefile");
    output = path.str().str();
  }

  if (auto err = graphOrErr->write(output)) {
    llvm::errs() << "Error: " << llvm::toString(std::move(err)) << "\n";
    return 1;
  }

  if (verbose)
    llvm::outs() << "Wrote " << graphOrErr->getRules().size()
                 << " rules to '" << output << "' (default target '"
                 << graphOrErr->getDefaultTarget() << "')\n";
  return 0;
}

int main(int argc, char **argv) {
  llvm::InitLLVM y(argc, argv);

  cl::HideUnrelatedOptions(mainCategory);
  cl::ParseCommandLineOptions(argc, argv, "fabflow build script generator\n");

  return execute();
}
