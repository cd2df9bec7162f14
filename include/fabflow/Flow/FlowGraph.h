//===- FlowGraph.h - Project-bound flow instantiation -----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the FlowGraph, the instantiation of a flow's stage
// descriptors for one project. Building a FlowGraph orders the stages
// topologically, elides the stages the configuration switches off, resolves
// each stage's options and binds it to the artifacts of its predecessors.
// Configuring it lets every stage contribute its rules to a CommandGraph.
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_FLOW_FLOWGRAPH_H
#define FABFLOW_FLOW_FLOWGRAPH_H

#include "fabflow/Flow/CommandGraph.h"
#include "fabflow/Flow/Stage.h"
#include "fabflow/Flow/StageRegistry.h"

#include "llvm/ADT/StringMap.h"

namespace fabflow {

/// User-supplied description of what is being built.
struct ProjectMetadata {
  /// Project name; canonical output file names derive from it.
  std::string name;

  /// Options visible to every stage.
  OptionMap globalOptions;

  /// Per-stage user options keyed by tool identifier. These take precedence
  /// over everything else.
  llvm::StringMap<OptionMap> stageOptions;

  /// Externally supplied files (design sources, constraints, netlists).
  std::vector<Artifact> files;
};

/// Behavioral switches and explicit tool locations.
struct FlowConfig {
  /// Flow-level switches, such as the synthesis tool selector. Also merged
  /// into every stage's options.
  OptionMap flowOptions;

  /// Tool executable name to path.
  OptionMap toolPaths;
};

/// One stage of a FlowGraph.
struct StageInstance {
  std::string toolId;

  /// Global, then flow, then descriptor overrides, then user stage options.
  /// Later values win key by key.
  OptionMap options;

  /// Included stages this one consumes from, in declaration order.
  std::vector<std::string> predecessors;

  /// Predecessor outputs followed by the project files.
  std::vector<Artifact> inputs;

  /// Artifacts the stage declared it produces.
  std::vector<Artifact> outputs;

  /// Filled in by FlowGraph::configure.
  std::string primaryOutput;

  std::unique_ptr<Stage> stage;
};

class FlowGraph {
public:
  FlowGraph(FlowGraph &&) = default;
  FlowGraph &operator=(FlowGraph &&) = default;

  /// Instantiate `descriptors` for a project.
  ///
  /// Fails with InvalidOption for an empty project name or a rejected
  /// selector value, InvalidFlow for duplicate stages or unknown successors,
  /// CycleDetected if the descriptors are not a DAG, UnknownTool if a stage
  /// variant is missing, and MissingPredecessorOutput if a stage requires an
  /// artifact that neither a predecessor nor the project files provide.
  static llvm::Expected<FlowGraph>
  build(const StageRegistry &registry,
        llvm::ArrayRef<StageDescriptor> descriptors,
        const ProjectMetadata &metadata, const FlowConfig &config);

  /// Let every stage, in order, add its rules to `graph`, then make the final
  /// stage's primary output the default target.
  llvm::Error configure(CommandGraph &graph);

  llvm::StringRef getName() const { return name; }

  llvm::ArrayRef<StageInstance> getStages() const { return stages; }

  /// Return the included stage for `toolId`, or null.
  const StageInstance *getStage(llvm::StringRef toolId) const;

  /// Tool identifiers removed by configuration, in declaration order.
  llvm::ArrayRef<std::string> getElidedStages() const { return elided; }

  /// Externally supplied files the stages were bound to.
  llvm::ArrayRef<Artifact> getProjectFiles() const { return projectFiles; }

private:
  FlowGraph() = default;

  std::string name;
  std::vector<StageInstance> stages;
  std::vector<std::string> elided;
  std::vector<Artifact> projectFiles;
};

/// Resolve `flowName`, build its FlowGraph and configure it into a new
/// CommandGraph.
llvm::Expected<CommandGraph>
buildCommandGraph(const StageRegistry &registry, llvm::StringRef flowName,
                  const ProjectMetadata &metadata, const FlowConfig &config);

} // namespace fabflow

#endif // FABFLOW_FLOW_FLOWGRAPH_H
