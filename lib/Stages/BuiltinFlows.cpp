//===- BuiltinFlows.cpp - Flows and stages shipped with fabflow -----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "fabflow/Stages/BuiltinFlows.h"
#include "fabflow/Stages/IseStage.h"
#include "fabflow/Stages/YosysStage.h"

using namespace fabflow;
using namespace fabflow::stages;

void fabflow::stages::registerBuiltinStages(StageRegistry &registry) {
  registry.registerStage("yosys", YosysStage::create);
  registry.registerStage("ise", IseStage::create);
}

static FlowDescriptor getIseFlow() {
  FlowDescriptor flow;
  flow.name = "ise";
  flow.description = "Xilinx ISE, with optional synthesis by Yosys";

  StageDescriptor yosys;
  yosys.toolId = "yosys";
  yosys.successors = {"ise"};
  yosys.optionOverrides = {{"arch", "xilinx"}, {"output_format", "edif"}};
  StageSelector selector;
  selector.option = "synth";
  selector.defaultValue = "ise";
  selector.allowedValues = {"ise", "yosys", "none"};
  selector.includeWhen = {"yosys"};
  yosys.selector = std::move(selector);

  StageDescriptor ise;
  ise.toolId = "ise";

  flow.stages = {std::move(yosys), std::move(ise)};
  flow.options = {
      {"synth", "Synthesis tool: ise (default), yosys, or none to use the edif "
                "netlists among the project files"},
      {"pnr", "Place and route tool: ise (default), or none to stop after "
              "synthesis"}};
  return flow;
}

void fabflow::stages::registerBuiltinFlows(StageRegistry &registry) {
  registry.registerFlow(getIseFlow());
}

namespace {
struct BuiltinRegistry : public StageRegistry {
  BuiltinRegistry() {
    registerBuiltinStages(*this);
    registerBuiltinFlows(*this);
  }
};
} // namespace

const StageRegistry &fabflow::stages::getBuiltinRegistry() {
  static const BuiltinRegistry registry;
  return registry;
}
