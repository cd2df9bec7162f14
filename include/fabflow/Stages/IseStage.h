//===- IseStage.h - Xilinx ISE implementation stage -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Xilinx ISE: project creation, synthesis (XST) unless a netlist is supplied,
// place and route, bitstream generation and device programming. Every step is
// driven by a TCL script executed through xtclsh.
//
// Rules contributed for a project named `top`:
//
//   top.xise                          xtclsh top.tcl, depends on edif inputs
//   top/__synthesis_is_complete__     xtclsh top_synth.tcl top.xise  (synth=ise)
//   synth                             virtual, groups the synthesis products
//   top.bit                           xtclsh top_run.tcl top.xise
//   build-gui                         virtual, opens the project in ISE
//   pgm                               virtual, programs the device
//
// Options:
//   synth  ise (default): synthesize with XST
//          yosys: use top.edif produced upstream
//          none:  use the edif netlists among the project files, of which
//                 there must be at least one
//   pnr    ise (default), or none to stop after synthesis
//   part   device passed to the programming script
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_STAGES_ISESTAGE_H
#define FABFLOW_STAGES_ISESTAGE_H

#include "fabflow/Flow/Stage.h"

namespace fabflow {
namespace stages {

class IseStage : public Stage {
public:
  static llvm::Expected<std::unique_ptr<Stage>>
  create(const StageContext &context);

  IseStage(const StageContext &context, std::string synth, std::string pnr);

  std::vector<Artifact> getOutputs() const override;
  std::vector<std::string> getRequiredInputs() const override;
  std::vector<std::string> getRequiredInputTypes() const override;

  llvm::Expected<std::string> configure(llvm::ArrayRef<Artifact> inputs,
                                        CommandGraph &graph) override;

  std::string getProjectFile() const { return context.projectName + ".xise"; }
  std::string getBitstream() const { return context.projectName + ".bit"; }

private:
  StageContext context;
  std::string synth;
  std::string pnr;
};

} // namespace stages
} // namespace fabflow

#endif // FABFLOW_STAGES_ISESTAGE_H
