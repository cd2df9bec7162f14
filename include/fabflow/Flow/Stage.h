//===- Stage.h - Tool stage capability interface ----------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the interface implemented by every tool stage (synthesis,
// place and route, bitstream generation, ...). A stage is constructed from a
// StageContext holding everything it may consult: its resolved options, the
// project name and the tool executable paths. No stage reads process-wide
// state.
//
// A stage declares the artifacts it produces and the artifacts it requires
// from upstream, and contributes its build rules to a CommandGraph when
// configured.
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_FLOW_STAGE_H
#define FABFLOW_FLOW_STAGE_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fabflow {

class CommandGraph;

/// Option name to value. Ordered so that anything printed from it is stable.
using OptionMap = std::map<std::string, std::string>;

/// A file flowing through a flow: a project source or a stage output.
struct Artifact {
  /// File name, relative to the work root.
  std::string name;

  /// Opaque file type label (e.g. "edif", "UCF", "verilogSource").
  std::string type;

  Artifact() = default;
  Artifact(std::string name, std::string type = "")
      : name(std::move(name)), type(std::move(type)) {}

  bool operator==(const Artifact &other) const {
    return name == other.name && type == other.type;
  }
};

//===----------------------------------------------------------------------===//
// StageContext
//===----------------------------------------------------------------------===//

/// Explicit configuration handed to a stage at construction.
struct StageContext {
  /// The tool identifier the stage was selected by.
  std::string toolId;

  /// Project name; canonical output names derive from it.
  std::string projectName;

  /// Resolved options (global, flow, descriptor and user overrides merged).
  OptionMap options;

  /// Tool executable name to path.
  OptionMap toolPaths;

  bool hasOption(llvm::StringRef name) const;

  /// Return the option value, or `defaultValue` when unset.
  std::string getOption(llvm::StringRef name,
                        llvm::StringRef defaultValue = "") const;

  /// Return the option value, which must be one of `allowed`. An unset option
  /// yields `defaultValue`. Any other value fails with InvalidOption.
  llvm::Expected<std::string>
  getChoice(llvm::StringRef name, llvm::StringRef defaultValue,
            llvm::ArrayRef<llvm::StringRef> allowed) const;

  /// Return the command used to invoke `tool`: its configured path if any,
  /// otherwise the bare name for lookup through PATH.
  std::string getExecutable(llvm::StringRef tool) const;
};

//===----------------------------------------------------------------------===//
// Stage
//===----------------------------------------------------------------------===//

/// A configured instance of one tool in a flow.
class Stage {
public:
  virtual ~Stage();

  /// Artifacts this stage makes available to its successors.
  virtual std::vector<Artifact> getOutputs() const = 0;

  /// Names of artifacts that must be available as inputs, either from a
  /// predecessor or from the project files.
  virtual std::vector<std::string> getRequiredInputs() const { return {}; }

  /// File types of which at least one artifact must be among the inputs.
  virtual std::vector<std::string> getRequiredInputTypes() const { return {}; }

  /// Contribute build rules to `graph`. Returns the primary output (a target
  /// name), or an empty string if the stage has none. The graph reference
  /// must not be retained past this call.
  virtual llvm::Expected<std::string>
  configure(llvm::ArrayRef<Artifact> inputs, CommandGraph &graph) = 0;
};

/// Creates a stage variant from its context. Factories validate options and
/// fail with InvalidOption on values they do not accept.
using StageFactory = std::function<llvm::Expected<std::unique_ptr<Stage>>(
    const StageContext &)>;

} // namespace fabflow

#endif // FABFLOW_FLOW_STAGE_H
