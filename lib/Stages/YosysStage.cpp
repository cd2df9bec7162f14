//===- YosysStage.cpp - Yosys synthesis stage -----------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "fabflow/Stages/YosysStage.h"
#include "fabflow/Flow/CommandGraph.h"
#include "fabflow/Flow/FlowError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"

#include <cassert>

using namespace fabflow;
using namespace fabflow::stages;

namespace {

struct NetlistFormat {
  llvm::StringRef format;
  llvm::StringRef extension;
  llvm::StringRef fileType;
};

} // namespace

static const NetlistFormat netlistFormats[] = {
    {"blif", "blif", "blif"},
    {"edif", "edif", "edif"},
    {"json", "json", "jsonNetlist"},
    {"verilog", "v", "verilogSource"},
};

/// File type prefixes of the sources Yosys reads. Types may carry a language
/// revision suffix, as in "verilogSource-2005".
static const llvm::StringRef hdlTypePrefixes[] = {
    "verilogSource", "systemVerilogSource", "vhdlSource"};

bool YosysStage::isHdlSource(const Artifact &artifact) {
  llvm::StringRef type = artifact.type;
  return llvm::any_of(hdlTypePrefixes, [&](llvm::StringRef prefix) {
    return type.startswith(prefix);
  });
}

llvm::Expected<std::unique_ptr<Stage>>
YosysStage::create(const StageContext &context) {
  if (context.getOption("arch").empty())
    return createFlowError(FlowErrc::InvalidOption,
                           "option 'arch' must be set for tool '%s'",
                           context.toolId.c_str());

  llvm::SmallVector<llvm::StringRef, 4> formats;
  for (const auto &entry : netlistFormats)
    formats.push_back(entry.format);
  auto formatOrErr = context.getChoice("output_format", "blif", formats);
  if (!formatOrErr)
    return formatOrErr.takeError();

  const NetlistFormat *selected = nullptr;
  for (const auto &entry : netlistFormats)
    if (entry.format == *formatOrErr)
      selected = &entry;
  assert(selected && "accepted format has no table entry");

  Artifact netlist(context.projectName + "." + selected->extension.str(),
                   selected->fileType.str());
  return std::make_unique<YosysStage>(context, std::move(netlist));
}

YosysStage::YosysStage(const StageContext &context, Artifact netlist)
    : context(context), netlist(std::move(netlist)) {}

std::string YosysStage::getScriptName() const {
  return context.projectName + "_yosys.tcl";
}

std::vector<Artifact> YosysStage::getOutputs() const { return {netlist}; }

llvm::Expected<std::string>
YosysStage::configure(llvm::ArrayRef<Artifact> inputs, CommandGraph &graph) {
  std::string script = getScriptName();
  graph.addSource(script);

  std::vector<std::string> depends = {script};
  for (const auto &input : inputs)
    if (isHdlSource(input))
      depends.push_back(input.name);

  std::vector<std::string> command = {context.getExecutable("yosys"), "-l",
                                      "yosys.log", "-p", "tcl " + script};
  if (auto err = graph.add(command, {netlist.name}, depends))
    return std::move(err);
  return netlist.name;
}
