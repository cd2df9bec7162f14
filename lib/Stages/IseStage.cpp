//===- IseStage.cpp - Xilinx ISE implementation stage ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "fabflow/Stages/IseStage.h"
#include "fabflow/Flow/CommandGraph.h"
#include "fabflow/Flow/FlowError.h"

using namespace fabflow;
using namespace fabflow::stages;

llvm::Expected<std::unique_ptr<Stage>>
IseStage::create(const StageContext &context) {
  auto synthOrErr = context.getChoice("synth", "ise", {"ise", "yosys", "none"});
  if (!synthOrErr)
    return synthOrErr.takeError();
  auto pnrOrErr = context.getChoice("pnr", "ise", {"ise", "none"});
  if (!pnrOrErr)
    return pnrOrErr.takeError();
  return std::make_unique<IseStage>(context, std::move(*synthOrErr),
                                    std::move(*pnrOrErr));
}

IseStage::IseStage(const StageContext &context, std::string synth,
                   std::string pnr)
    : context(context), synth(std::move(synth)), pnr(std::move(pnr)) {}

std::vector<Artifact> IseStage::getOutputs() const {
  return {Artifact(getProjectFile(), "iseProject"),
          Artifact(getBitstream(), "bitstream")};
}

std::vector<std::string> IseStage::getRequiredInputs() const {
  if (synth == "yosys")
    return {context.projectName + ".edif"};
  return {};
}

std::vector<std::string> IseStage::getRequiredInputTypes() const {
  if (synth == "none")
    return {"edif"};
  return {};
}

llvm::Expected<std::string>
IseStage::configure(llvm::ArrayRef<Artifact> inputs, CommandGraph &graph) {
  const std::string &name = context.projectName;
  std::string xtclsh = context.getExecutable("xtclsh");
  std::string projectFile = getProjectFile();
  std::string bitstream = getBitstream();

  std::string projectScript = name + ".tcl";
  std::string synthScript = name + "_synth.tcl";
  std::string runScript = name + "_run.tcl";
  std::string pgmScript = name + "_pgm.tcl";
  for (const auto &script : {projectScript, synthScript, runScript, pgmScript})
    graph.addSource(script);

  std::vector<std::string> netlists;
  for (const auto &input : inputs)
    if (input.type == "edif")
      netlists.push_back(input.name);

  // Project file.
  std::vector<std::string> depends = {projectScript};
  depends.insert(depends.end(), netlists.begin(), netlists.end());
  if (auto err = graph.add({xtclsh, projectScript}, {projectFile}, depends))
    return std::move(err);

  // Synthesis, unless the netlists come from elsewhere.
  std::vector<std::string> synthesized = netlists;
  if (synth == "ise") {
    std::vector<std::string> synthDepends = {synthScript, projectFile};
    synthesized = {name + "/__synthesis_is_complete__"};
    if (auto err = graph.add({xtclsh, synthScript, projectFile}, synthesized,
                             synthDepends))
      return std::move(err);
  }
  if (auto err = graph.addVirtual({}, {"synth"}, synthesized))
    return std::move(err);

  // Place and route, bitstream generation.
  if (auto err = graph.add({xtclsh, runScript, projectFile}, {bitstream},
                           {runScript, projectFile}))
    return std::move(err);

  if (auto err = graph.addVirtual({context.getExecutable("ise"), projectFile},
                                  {"build-gui"}, {projectFile}))
    return std::move(err);

  std::vector<std::string> pgmCommand = {
      context.getExecutable("ise"), "-quiet", "-nolog", "-notrace", "-mode",
      "batch", "-source", pgmScript, "-tclargs"};
  std::string part = context.getOption("part");
  if (!part.empty())
    pgmCommand.push_back(part);
  pgmCommand.push_back(bitstream);
  if (auto err = graph.addVirtual(pgmCommand, {"pgm"}, {pgmScript, bitstream}))
    return std::move(err);

  if (pnr == "none")
    return std::string("synth");
  return bitstream;
}
