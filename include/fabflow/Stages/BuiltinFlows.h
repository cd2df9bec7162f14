//===- BuiltinFlows.h - Flows and stages shipped with fabflow ---*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Registration of the built-in stage variants and flows.
//
//   ise   yosys -> ise   Xilinx ISE, optionally synthesized with Yosys
//                        (flow option synth=yosys)
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_STAGES_BUILTINFLOWS_H
#define FABFLOW_STAGES_BUILTINFLOWS_H

#include "fabflow/Flow/StageRegistry.h"

namespace fabflow {
namespace stages {

/// Register every built-in stage variant with `registry`.
void registerBuiltinStages(StageRegistry &registry);

/// Register every built-in flow with `registry`.
void registerBuiltinFlows(StageRegistry &registry);

/// Return a registry holding all built-in stages and flows. It is populated
/// once on first use and read-only afterwards.
const StageRegistry &getBuiltinRegistry();

} // namespace stages
} // namespace fabflow

#endif // FABFLOW_STAGES_BUILTINFLOWS_H
