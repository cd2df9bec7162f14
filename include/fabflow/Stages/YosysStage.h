//===- YosysStage.h - Yosys synthesis stage ---------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Synthesis with Yosys. The stage runs a generated TCL script and produces a
// netlist named after the project in the requested format. The netlist is
// rebuilt when the script or an HDL source changes.
//
// Options:
//   arch           target architecture passed to the synthesis script
//                  (required, e.g. "xilinx", "ice40")
//   output_format  netlist format: blif (default), edif, json or verilog
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_STAGES_YOSYSSTAGE_H
#define FABFLOW_STAGES_YOSYSSTAGE_H

#include "fabflow/Flow/Stage.h"

namespace fabflow {
namespace stages {

class YosysStage : public Stage {
public:
  static llvm::Expected<std::unique_ptr<Stage>>
  create(const StageContext &context);

  YosysStage(const StageContext &context, Artifact netlist);

  std::vector<Artifact> getOutputs() const override;

  llvm::Expected<std::string> configure(llvm::ArrayRef<Artifact> inputs,
                                        CommandGraph &graph) override;

  /// Name of the synthesis script the stage runs.
  std::string getScriptName() const;

  /// Whether `artifact` is a Verilog, SystemVerilog or VHDL source. Only
  /// these are rule dependencies; constraints and other files are not read.
  static bool isHdlSource(const Artifact &artifact);

private:
  StageContext context;
  Artifact netlist;
};

} // namespace stages
} // namespace fabflow

#endif // FABFLOW_STAGES_YOSYSSTAGE_H
