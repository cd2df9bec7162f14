//===- Stage.cpp - Tool stage capability interface ------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "fabflow/Flow/Stage.h"
#include "fabflow/Flow/FlowError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"

using namespace fabflow;

//===----------------------------------------------------------------------===//
// StageContext
//===----------------------------------------------------------------------===//

bool StageContext::hasOption(llvm::StringRef name) const {
  return options.count(name.str());
}

std::string StageContext::getOption(llvm::StringRef name,
                                    llvm::StringRef defaultValue) const {
  auto it = options.find(name.str());
  if (it == options.end())
    return defaultValue.str();
  return it->second;
}

llvm::Expected<std::string>
StageContext::getChoice(llvm::StringRef name, llvm::StringRef defaultValue,
                        llvm::ArrayRef<llvm::StringRef> allowed) const {
  std::string value = getOption(name, defaultValue);
  if (llvm::is_contained(allowed, value))
    return value;
  return createFlowError(FlowErrc::InvalidOption,
                         "invalid value '%s' for option '%s' of tool '%s' "
                         "(expected one of: %s)",
                         value.c_str(), name.str().c_str(), toolId.c_str(),
                         llvm::join(allowed, ", ").c_str());
}

std::string StageContext::getExecutable(llvm::StringRef tool) const {
  auto it = toolPaths.find(tool.str());
  if (it == toolPaths.end() || it->second.empty())
    return tool.str();
  return it->second;
}

Stage::~Stage() = default;
