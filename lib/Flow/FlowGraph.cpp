//===- FlowGraph.cpp - Project-bound flow instantiation -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements FlowGraph construction and configuration.
//
//===----------------------------------------------------------------------===//

#include "fabflow/Flow/FlowGraph.h"
#include "fabflow/Flow/FlowError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"

#include <set>

#define DEBUG_TYPE "fabflow-flow-graph"

using namespace fabflow;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

/// Copy every option of `from` into `into`, replacing existing values.
static void mergeOptions(OptionMap &into, const OptionMap &from) {
  for (const auto &kv : from)
    into[kv.first] = kv.second;
}

static void appendUnique(std::vector<Artifact> &into,
                         llvm::ArrayRef<Artifact> from) {
  for (const auto &artifact : from) {
    bool present = llvm::any_of(into, [&](const Artifact &existing) {
      return existing.name == artifact.name;
    });
    if (!present)
      into.push_back(artifact);
  }
}

/// Order descriptor indices so that every stage follows its predecessors.
/// Among ready stages the earliest declared goes first, so a list already in
/// topological order is returned unchanged.
static llvm::Expected<std::vector<size_t>>
sortStages(llvm::ArrayRef<StageDescriptor> descriptors,
           const llvm::StringMap<size_t> &indexOf) {
  size_t count = descriptors.size();
  std::vector<size_t> inDegree(count, 0);
  for (const auto &descriptor : descriptors)
    for (const auto &successor : descriptor.successors)
      ++inDegree[indexOf.lookup(successor)];

  std::set<size_t> ready;
  for (size_t i = 0; i < count; ++i)
    if (inDegree[i] == 0)
      ready.insert(i);

  std::vector<size_t> order;
  order.reserve(count);
  while (!ready.empty()) {
    size_t current = *ready.begin();
    ready.erase(ready.begin());
    order.push_back(current);
    for (const auto &successor : descriptors[current].successors) {
      size_t next = indexOf.lookup(successor);
      if (--inDegree[next] == 0)
        ready.insert(next);
    }
  }

  if (order.size() != count) {
    // Report the first declared stage left with unresolved predecessors.
    for (size_t i = 0; i < count; ++i)
      if (inDegree[i] != 0)
        return createFlowError(FlowErrc::CycleDetected,
                               "stage '%s' is part of a dependency cycle",
                               descriptors[i].toolId.c_str());
  }
  return order;
}

/// Decide whether a descriptor survives elision. Selector values outside the
/// declared set are rejected rather than defaulting to inclusion.
static llvm::Expected<bool> isIncluded(const StageDescriptor &descriptor,
                                       const FlowConfig &config) {
  if (!descriptor.selector)
    return true;

  const StageSelector &selector = *descriptor.selector;
  std::string value = selector.defaultValue;
  auto it = config.flowOptions.find(selector.option);
  if (it != config.flowOptions.end())
    value = it->second;

  if (!llvm::is_contained(selector.allowedValues, value))
    return createFlowError(FlowErrc::InvalidOption,
                           "invalid value '%s' for flow option '%s' "
                           "(expected one of: %s)",
                           value.c_str(), selector.option.c_str(),
                           llvm::join(selector.allowedValues, ", ").c_str());
  return llvm::is_contained(selector.includeWhen, value);
}

//===----------------------------------------------------------------------===//
// FlowGraph
//===----------------------------------------------------------------------===//

llvm::Expected<FlowGraph>
FlowGraph::build(const StageRegistry &registry,
                 llvm::ArrayRef<StageDescriptor> descriptors,
                 const ProjectMetadata &metadata, const FlowConfig &config) {
  if (metadata.name.empty())
    return createFlowError(FlowErrc::InvalidOption,
                           "project name must not be empty");

  llvm::StringMap<size_t> indexOf;
  for (size_t i = 0, e = descriptors.size(); i < e; ++i) {
    const auto &toolId = descriptors[i].toolId;
    if (toolId.empty())
      return createFlowError(FlowErrc::InvalidFlow,
                             "stage #%zu has no tool identifier", i);
    if (!indexOf.insert({toolId, i}).second)
      return createFlowError(FlowErrc::InvalidFlow,
                             "stage '%s' is declared more than once",
                             toolId.c_str());
  }
  for (const auto &descriptor : descriptors)
    for (const auto &successor : descriptor.successors)
      if (!indexOf.count(successor))
        return createFlowError(FlowErrc::InvalidFlow,
                               "stage '%s' feeds unknown stage '%s'",
                               descriptor.toolId.c_str(), successor.c_str());

  auto orderOrErr = sortStages(descriptors, indexOf);
  if (!orderOrErr)
    return orderOrErr.takeError();

  FlowGraph graph;
  graph.name = metadata.name;
  graph.projectFiles = metadata.files;

  std::vector<bool> included(descriptors.size(), true);
  for (size_t i = 0, e = descriptors.size(); i < e; ++i) {
    auto includedOrErr = isIncluded(descriptors[i], config);
    if (!includedOrErr)
      return includedOrErr.takeError();
    included[i] = *includedOrErr;
    if (!included[i]) {
      LLVM_DEBUG(llvm::dbgs() << "Eliding stage '" << descriptors[i].toolId
                              << "'\n");
      graph.elided.push_back(descriptors[i].toolId);
    }
  }

  // Predecessors in declaration order, including elided ones.
  std::vector<std::vector<size_t>> predecessors(descriptors.size());
  for (size_t i = 0, e = descriptors.size(); i < e; ++i)
    for (const auto &successor : descriptors[i].successors)
      predecessors[indexOf.lookup(successor)].push_back(i);

  llvm::StringMap<size_t> instanceOf;
  for (size_t index : *orderOrErr) {
    if (!included[index])
      continue;
    const StageDescriptor &descriptor = descriptors[index];

    StageInstance instance;
    instance.toolId = descriptor.toolId;
    instance.options = metadata.globalOptions;
    mergeOptions(instance.options, config.flowOptions);
    mergeOptions(instance.options, descriptor.optionOverrides);
    auto userIt = metadata.stageOptions.find(descriptor.toolId);
    if (userIt != metadata.stageOptions.end())
      mergeOptions(instance.options, userIt->second);

    StageContext context;
    context.toolId = descriptor.toolId;
    context.projectName = metadata.name;
    context.options = instance.options;
    context.toolPaths = config.toolPaths;

    auto stageOrErr = registry.createStage(context);
    if (!stageOrErr)
      return stageOrErr.takeError();
    instance.stage = std::move(*stageOrErr);
    instance.outputs = instance.stage->getOutputs();

    const std::string *elidedPredecessor = nullptr;
    for (size_t pred : predecessors[index]) {
      if (!included[pred]) {
        elidedPredecessor = &descriptors[pred].toolId;
        continue;
      }
      const StageInstance &upstream =
          graph.stages[instanceOf.lookup(descriptors[pred].toolId)];
      instance.predecessors.push_back(upstream.toolId);
      appendUnique(instance.inputs, upstream.outputs);
    }
    appendUnique(instance.inputs, metadata.files);

    for (const auto &required : instance.stage->getRequiredInputs()) {
      bool available = llvm::any_of(instance.inputs, [&](const Artifact &in) {
        return in.name == required;
      });
      if (available)
        continue;
      if (elidedPredecessor)
        return createFlowError(
            FlowErrc::MissingPredecessorOutput,
            "stage '%s' requires '%s', but predecessor '%s' was elided and "
            "no project file provides it",
            instance.toolId.c_str(), required.c_str(),
            elidedPredecessor->c_str());
      return createFlowError(FlowErrc::MissingPredecessorOutput,
                             "stage '%s' requires '%s', which no predecessor "
                             "or project file provides",
                             instance.toolId.c_str(), required.c_str());
    }

    for (const auto &type : instance.stage->getRequiredInputTypes()) {
      bool available = llvm::any_of(instance.inputs, [&](const Artifact &in) {
        return in.type == type;
      });
      if (available)
        continue;
      if (elidedPredecessor)
        return createFlowError(
            FlowErrc::MissingPredecessorOutput,
            "stage '%s' requires a '%s' file, but predecessor '%s' was elided "
            "and no project file provides one",
            instance.toolId.c_str(), type.c_str(), elidedPredecessor->c_str());
      return createFlowError(FlowErrc::MissingPredecessorOutput,
                             "stage '%s' requires a '%s' file, which no "
                             "predecessor or project file provides",
                             instance.toolId.c_str(), type.c_str());
    }

    LLVM_DEBUG({
      llvm::dbgs() << "Stage '" << instance.toolId << "': "
                   << instance.inputs.size() << " inputs, "
                   << instance.outputs.size() << " outputs\n";
      for (const auto &kv : instance.options)
        llvm::dbgs() << "  " << kv.first << " = " << kv.second << "\n";
    });

    instanceOf[instance.toolId] = graph.stages.size();
    graph.stages.push_back(std::move(instance));
  }

  return std::move(graph);
}

llvm::Error FlowGraph::configure(CommandGraph &graph) {
  for (const auto &file : projectFiles)
    graph.addSource(file.name);

  for (auto &instance : stages) {
    auto primaryOrErr = instance.stage->configure(instance.inputs, graph);
    if (!primaryOrErr)
      return primaryOrErr.takeError();
    instance.primaryOutput = *primaryOrErr;
    LLVM_DEBUG(llvm::dbgs() << "Configured stage '" << instance.toolId
                            << "', primary output '" << instance.primaryOutput
                            << "'\n");
  }

  if (stages.empty() || stages.back().primaryOutput.empty())
    return llvm::Error::success();
  return graph.setDefaultTarget(stages.back().primaryOutput);
}

const StageInstance *FlowGraph::getStage(llvm::StringRef toolId) const {
  for (const auto &instance : stages)
    if (instance.toolId == toolId)
      return &instance;
  return nullptr;
}

//===----------------------------------------------------------------------===//
// Driver
//===----------------------------------------------------------------------===//

llvm::Expected<CommandGraph>
fabflow::buildCommandGraph(const StageRegistry &registry,
                           llvm::StringRef flowName,
                           const ProjectMetadata &metadata,
                           const FlowConfig &config) {
  auto descriptorsOrErr = registry.resolve(flowName);
  if (!descriptorsOrErr)
    return descriptorsOrErr.takeError();

  auto flowOrErr =
      FlowGraph::build(registry, *descriptorsOrErr, metadata, config);
  if (!flowOrErr)
    return flowOrErr.takeError();

  CommandGraph graph;
  if (auto err = flowOrErr->configure(graph))
    return std::move(err);
  return std::move(graph);
}
