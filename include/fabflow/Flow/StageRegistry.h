//===- StageRegistry.h - Flow and stage variant registry --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the StageRegistry, which maps flow names to their ordered
// stage descriptors and tool identifiers to the factories of the stage
// variants implementing them. A registry is populated once and only read
// afterwards.
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_FLOW_STAGEREGISTRY_H
#define FABFLOW_FLOW_STAGEREGISTRY_H

#include "fabflow/Flow/Stage.h"

#include "llvm/ADT/StringMap.h"

#include <optional>

namespace fabflow {

/// Decides from a flow option whether a stage takes part in a flow.
struct StageSelector {
  /// Flow option inspected.
  std::string option;

  /// Value assumed when the option is not set.
  std::string defaultValue;

  /// Every value the option may take. Anything else is rejected.
  std::vector<std::string> allowedValues;

  /// Values for which the stage is included.
  std::vector<std::string> includeWhen;
};

/// Identity of one tool stage within a flow.
struct StageDescriptor {
  /// Tool identifier; also the tag selecting the stage variant.
  std::string toolId;

  /// Tool identifiers this stage's outputs feed. Empty for a terminal stage.
  std::vector<std::string> successors;

  /// Options applied on top of the global options for this stage.
  OptionMap optionOverrides;

  /// Present when the stage can be elided by configuration.
  std::optional<StageSelector> selector;
};

/// A documented flow option.
struct FlowOption {
  std::string name;
  std::string description;
};

/// A named composition of stages. Stages are declared predecessors first.
struct FlowDescriptor {
  std::string name;
  std::string description;
  std::vector<StageDescriptor> stages;
  std::vector<FlowOption> options;
};

class StageRegistry {
public:
  StageRegistry();
  ~StageRegistry();

  //===--------------------------------------------------------------------===//
  // Population
  //===--------------------------------------------------------------------===//

  /// Register a flow. A later registration under the same name replaces it.
  void registerFlow(FlowDescriptor flow);

  /// Register the stage variant implementing `toolId`.
  void registerStage(llvm::StringRef toolId, StageFactory factory);

  //===--------------------------------------------------------------------===//
  // Lookup
  //===--------------------------------------------------------------------===//

  /// Return the ordered stage descriptors of `flowName`. Fails with
  /// UnknownFlow when no such flow is registered.
  llvm::Expected<llvm::ArrayRef<StageDescriptor>>
  resolve(llvm::StringRef flowName) const;

  /// Return the flow named `flowName`, or null.
  const FlowDescriptor *getFlow(llvm::StringRef flowName) const;

  /// Return the registered flow names in sorted order.
  std::vector<std::string> getFlowNames() const;

  bool hasStage(llvm::StringRef toolId) const;

  /// Instantiate the stage variant for `context.toolId`. Fails with
  /// UnknownTool when no variant is registered under that tag.
  llvm::Expected<std::unique_ptr<Stage>>
  createStage(const StageContext &context) const;

private:
  llvm::StringMap<FlowDescriptor> flows;
  llvm::StringMap<StageFactory> factories;
};

} // namespace fabflow

#endif // FABFLOW_FLOW_STAGEREGISTRY_H
