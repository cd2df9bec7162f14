//===- ProjectConfig.h - Project configuration support ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the ProjectConfig class for loading fabflow project
// configuration from YAML files (fabflow.yaml).
//
// Example configuration:
//
// ```yaml
// project:
//   name: "blinky"
//   flow: "ise"
//   work_root: "build"
//
// files:
//   - "blinky.v"
//   - { name: "blinky.ucf", type: "UCF" }
//
// options:
//   family: "spartan6"
//   device: "xc6slx9"
//
// flow_options:
//   synth: "yosys"
//
// tool_options:
//   yosys:
//     yosys_synth_options: ["-iopad", "-family xc6s"]
//
// tool_paths:
//   xtclsh: "/opt/Xilinx/14.7/ISE_DS/ISE/bin/lin64/xtclsh"
// ```
//
//===----------------------------------------------------------------------===//

#ifndef FABFLOW_SUPPORT_PROJECTCONFIG_H
#define FABFLOW_SUPPORT_PROJECTCONFIG_H

#include "fabflow/Flow/FlowGraph.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fabflow {

//===----------------------------------------------------------------------===//
// Project Info
//===----------------------------------------------------------------------===//

/// Basic project information.
struct ProjectInfo {
  /// Project name; canonical output names derive from it.
  std::string name;

  /// Name of the flow to instantiate.
  std::string flow;

  /// Directory the build runs in, relative to the configuration file.
  std::string workRoot;
};

//===----------------------------------------------------------------------===//
// ProjectConfig Class
//===----------------------------------------------------------------------===//

/// Main project configuration class.
class ProjectConfig {
public:
  ProjectConfig();
  ~ProjectConfig();

  //===--------------------------------------------------------------------===//
  // Loading Methods
  //===--------------------------------------------------------------------===//

  /// Load configuration from a YAML file.
  static llvm::Expected<std::unique_ptr<ProjectConfig>>
  loadFromFile(llvm::StringRef filePath);

  /// Load configuration from a YAML string.
  static llvm::Expected<std::unique_ptr<ProjectConfig>>
  loadFromYAML(llvm::StringRef yamlContent);

  /// Find and load project configuration from a directory.
  /// Searches for fabflow.yaml, .fabflow.yaml, fabflow.yml, .fabflow.yml.
  static llvm::Expected<std::unique_ptr<ProjectConfig>>
  findAndLoad(llvm::StringRef directory);

  //===--------------------------------------------------------------------===//
  // Accessors
  //===--------------------------------------------------------------------===//

  const ProjectInfo &getProjectInfo() const { return projectInfo; }
  void setProjectInfo(const ProjectInfo &info) { projectInfo = info; }

  const std::vector<Artifact> &getFiles() const { return files; }
  void addFile(Artifact file) { files.push_back(std::move(file)); }

  /// Options visible to every stage.
  const OptionMap &getOptions() const { return options; }
  void setOption(llvm::StringRef key, llvm::StringRef value) {
    options[key.str()] = value.str();
  }

  /// Options steering flow shape, e.g. which stages are elided.
  const OptionMap &getFlowOptions() const { return flowOptions; }
  void setFlowOption(llvm::StringRef key, llvm::StringRef value) {
    flowOptions[key.str()] = value.str();
  }

  /// Options applied to a single tool, or null if none were given.
  const OptionMap *getToolOptions(llvm::StringRef toolId) const;
  void setToolOption(llvm::StringRef toolId, llvm::StringRef key,
                     llvm::StringRef value) {
    toolOptions[toolId][key.str()] = value.str();
  }

  const OptionMap &getToolPaths() const { return toolPaths; }
  void setToolPath(llvm::StringRef tool, llvm::StringRef path) {
    toolPaths[tool.str()] = path.str();
  }

  /// Get the directory holding the configuration file.
  llvm::StringRef getRootDirectory() const { return rootDirectory; }
  void setRootDirectory(llvm::StringRef dir) { rootDirectory = dir.str(); }

  //===--------------------------------------------------------------------===//
  // Resolution Methods
  //===--------------------------------------------------------------------===//

  /// Resolve a path relative to the project root.
  std::string resolvePath(llvm::StringRef path) const;

  /// Return the resolved work root; "build" when none is configured.
  std::string getWorkRoot() const;

  /// Return the project description consumed by the flow graph builder.
  ProjectMetadata getProjectMetadata() const;

  /// Return the flow-level configuration.
  FlowConfig getFlowConfig() const;

  //===--------------------------------------------------------------------===//
  // Validation
  //===--------------------------------------------------------------------===//

  /// Check that the configuration names a project and a flow.
  llvm::Error validate() const;

  /// Check if the configuration is empty.
  bool isEmpty() const;

private:
  ProjectInfo projectInfo;
  std::vector<Artifact> files;
  OptionMap options;
  OptionMap flowOptions;
  llvm::StringMap<OptionMap> toolOptions;
  OptionMap toolPaths;
  std::string rootDirectory;
};

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//

/// Get the list of recognized project configuration file names.
llvm::ArrayRef<llvm::StringRef> getProjectConfigFileNames();

/// Check if a file name is a recognized project configuration file.
bool isProjectConfigFile(llvm::StringRef filename);

/// Split "key=value" into its parts. A missing '=' yields an empty value.
std::pair<std::string, std::string> parseAssignment(llvm::StringRef assignment);

} // namespace fabflow

#endif // FABFLOW_SUPPORT_PROJECTCONFIG_H
