//===- StageRegistry.cpp - Flow and stage variant registry ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "fabflow/Flow/StageRegistry.h"
#include "fabflow/Flow/FlowError.h"

#include "llvm/Support/Debug.h"

#include <algorithm>

#define DEBUG_TYPE "fabflow-stage-registry"

using namespace fabflow;

//===----------------------------------------------------------------------===//
// StageRegistry
//===----------------------------------------------------------------------===//

StageRegistry::StageRegistry() = default;
StageRegistry::~StageRegistry() = default;

void StageRegistry::registerFlow(FlowDescriptor flow) {
  LLVM_DEBUG(llvm::dbgs() << "Registering flow '" << flow.name << "' with "
                          << flow.stages.size() << " stages\n");
  std::string name = flow.name;
  flows[name] = std::move(flow);
}

void StageRegistry::registerStage(llvm::StringRef toolId,
                                  StageFactory factory) {
  factories[toolId] = std::move(factory);
}

llvm::Expected<llvm::ArrayRef<StageDescriptor>>
StageRegistry::resolve(llvm::StringRef flowName) const {
  const FlowDescriptor *flow = getFlow(flowName);
  if (!flow)
    return createFlowError(FlowErrc::UnknownFlow, "unknown flow '%s'",
                           flowName.str().c_str());
  return llvm::ArrayRef<StageDescriptor>(flow->stages);
}

const FlowDescriptor *StageRegistry::getFlow(llvm::StringRef flowName) const {
  auto it = flows.find(flowName);
  if (it == flows.end())
    return nullptr;
  return &it->second;
}

std::vector<std::string> StageRegistry::getFlowNames() const {
  std::vector<std::string> names;
  names.reserve(flows.size());
  for (const auto &entry : flows)
    names.push_back(entry.first().str());
  std::sort(names.begin(), names.end());
  return names;
}

bool StageRegistry::hasStage(llvm::StringRef toolId) const {
  return factories.count(toolId);
}

llvm::Expected<std::unique_ptr<Stage>>
StageRegistry::createStage(const StageContext &context) const {
  auto it = factories.find(context.toolId);
  if (it == factories.end())
    return createFlowError(FlowErrc::UnknownTool,
                           "no stage registered for tool '%s'",
                           context.toolId.c_str());
  return it->second(context);
}
