//===- FlowError.h - Flow and command graph errors --------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the error codes reported by the flow graph builder and
// the command graph. Errors travel as llvm::StringError values whose message
// names the offending flow, tool, target or path, and whose error code lives
// in the fabflow error category.
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_FLOW_FLOWERROR_H
#define FABFLOW_FLOW_FLOWERROR_H

#include "llvm/Support/Error.h"

#include <string>
#include <system_error>

namespace fabflow {

/// Error conditions raised while building flows and command graphs. All of
/// them are terminal for the current build invocation.
enum class FlowErrc {
  UnknownFlow = 1,
  UnknownTool,
  InvalidFlow,
  CycleDetected,
  MissingPredecessorOutput,
  InvalidOption,
  InvalidRule,
  ConflictingRule,
  DefaultTargetAlreadySet,
  MissingDefaultTarget,
  DanglingDependency,
  GraphFinalized,
  IOError,
};

/// Return the error category shared by all FlowErrc codes.
const std::error_category &getFlowErrorCategory();

std::error_code make_error_code(FlowErrc code);

/// Create an llvm::Error carrying `code` and a printf-style message.
template <typename... Ts>
llvm::Error createFlowError(FlowErrc code, const char *fmt,
                            const Ts &...vals) {
  return llvm::createStringError(make_error_code(code), fmt, vals...);
}

} // namespace fabflow

namespace std {
template <>
struct is_error_code_enum<fabflow::FlowErrc> : std::true_type {};
} // namespace std

#endif // FABFLOW_FLOW_FLOWERROR_H
