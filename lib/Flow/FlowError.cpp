//===- FlowError.cpp - Flow and command graph errors ----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "fabflow/Flow/FlowError.h"

using namespace fabflow;

namespace {

class FlowErrorCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "fabflow"; }

  std::string message(int ev) const override {
    switch (static_cast<FlowErrc>(ev)) {
    case FlowErrc::UnknownFlow:
      return "unknown flow";
    case FlowErrc::UnknownTool:
      return "unknown tool";
    case FlowErrc::InvalidFlow:
      return "invalid flow description";
    case FlowErrc::CycleDetected:
      return "dependency cycle detected";
    case FlowErrc::MissingPredecessorOutput:
      return "missing predecessor output";
    case FlowErrc::InvalidOption:
      return "invalid option";
    case FlowErrc::InvalidRule:
      return "invalid rule";
    case FlowErrc::ConflictingRule:
      return "conflicting rule";
    case FlowErrc::DefaultTargetAlreadySet:
      return "default target already set";
    case FlowErrc::MissingDefaultTarget:
      return "missing default target";
    case FlowErrc::DanglingDependency:
      return "dangling dependency";
    case FlowErrc::GraphFinalized:
      return "command graph already finalized";
    case FlowErrc::IOError:
      return "I/O error";
    }
    return "unknown fabflow error";
  }
};

} // namespace

const std::error_category &fabflow::getFlowErrorCategory() {
  static FlowErrorCategory category;
  return category;
}

std::error_code fabflow::make_error_code(FlowErrc code) {
  return std::error_code(static_cast<int>(code), getFlowErrorCategory());
}
