//===- ProjectConfig.cpp - Project configuration support ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the ProjectConfig class for loading fabflow project
// configuration from YAML files.
//
//===----------------------------------------------------------------------===//

#include "fabflow/Support/ProjectConfig.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"

#include <functional>

using namespace fabflow;

//===----------------------------------------------------------------------===//
// Project Configuration File Names
//===----------------------------------------------------------------------===//

static const llvm::StringRef configFileNames[] = {
    "fabflow.yaml", ".fabflow.yaml", "fabflow.yml", ".fabflow.yml"};

llvm::ArrayRef<llvm::StringRef> fabflow::getProjectConfigFileNames() {
  return configFileNames;
}

bool fabflow::isProjectConfigFile(llvm::StringRef filename) {
  llvm::StringRef basename = llvm::sys::path::filename(filename);
  for (const auto &name : configFileNames) {
    if (basename == name)
      return true;
  }
  return false;
}

std::pair<std::string, std::string>
fabflow::parseAssignment(llvm::StringRef assignment) {
  auto pos = assignment.find('=');
  if (pos == llvm::StringRef::npos)
    return {assignment.trim().str(), ""};
  return {assignment.substr(0, pos).trim().str(),
          assignment.substr(pos + 1).trim().str()};
}

//===----------------------------------------------------------------------===//
// YAML Parsing Helpers
//===----------------------------------------------------------------------===//

namespace {

/// Get scalar value from a YAML node.
llvm::StringRef getScalar(llvm::yaml::Node *node,
                          llvm::SmallVectorImpl<char> &storage) {
  if (auto *scalar = llvm::dyn_cast_or_null<llvm::yaml::ScalarNode>(node))
    return scalar->getValue(storage);
  return "";
}

/// Get an option value. Sequences are joined with spaces, so a list of
/// command-line flags can be written one per line.
std::string getOptionValue(llvm::yaml::Node *node) {
  if (auto *seq = llvm::dyn_cast_or_null<llvm::yaml::SequenceNode>(node)) {
    std::string joined;
    for (auto &item : *seq) {
      llvm::SmallString<128> storage;
      auto val = getScalar(&item, storage);
      if (val.empty())
        continue;
      if (!joined.empty())
        joined += ' ';
      joined += val.str();
    }
    return joined;
  }
  llvm::SmallString<128> storage;
  return getScalar(node, storage).str();
}

/// Parse a YAML mapping node with a callback for each key-value pair.
bool parseMapping(llvm::yaml::MappingNode *mapping,
                  std::function<bool(llvm::StringRef, llvm::yaml::Node *)> cb) {
  for (auto &entry : *mapping) {
    auto *keyNode =
        llvm::dyn_cast_or_null<llvm::yaml::ScalarNode>(entry.getKey());
    if (!keyNode)
      continue;

    llvm::SmallString<64> keyStorage;
    llvm::StringRef key = keyNode->getValue(keyStorage);

    if (!cb(key, entry.getValue()))
      return false;
  }
  return true;
}

/// Parse a flat key-value section into an option map.
void parseOptionMap(llvm::yaml::MappingNode *node, OptionMap &out) {
  parseMapping(node, [&](llvm::StringRef key, llvm::yaml::Node *value) {
    out[key.str()] = getOptionValue(value);
    return true;
  });
}

/// Parse project info section.
void parseProjectInfo(llvm::yaml::MappingNode *node, ProjectInfo &info) {
  parseMapping(node, [&](llvm::StringRef key, llvm::yaml::Node *value) {
    llvm::SmallString<128> storage;
    if (key == "name")
      info.name = getScalar(value, storage).str();
    else if (key == "flow")
      info.flow = getScalar(value, storage).str();
    else if (key == "work_root")
      info.workRoot = getScalar(value, storage).str();
    return true;
  });
}

/// Parse the file list. Entries are either a bare file name or a mapping
/// with `name` and `type`.
void parseFiles(llvm::yaml::SequenceNode *node, std::vector<Artifact> &out) {
  for (auto &item : *node) {
    if (auto *mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(&item)) {
      Artifact file;
      parseMapping(mapping, [&](llvm::StringRef key, llvm::yaml::Node *value) {
        llvm::SmallString<128> storage;
        if (key == "name")
          file.name = getScalar(value, storage).str();
        else if (key == "type" || key == "file_type")
          file.type = getScalar(value, storage).str();
        return true;
      });
      if (!file.name.empty())
        out.push_back(std::move(file));
      continue;
    }

    llvm::SmallString<128> storage;
    auto name = getScalar(&item, storage);
    if (!name.empty())
      out.emplace_back(name.str());
  }
}

} // namespace

//===----------------------------------------------------------------------===//
// ProjectConfig Implementation
//===----------------------------------------------------------------------===//

ProjectConfig::ProjectConfig() = default;
ProjectConfig::~ProjectConfig() = default;

llvm::Expected<std::unique_ptr<ProjectConfig>>
ProjectConfig::loadFromFile(llvm::StringRef filePath) {
  auto fileOrErr = llvm::MemoryBuffer::getFile(filePath);
  if (auto ec = fileOrErr.getError())
    return llvm::createStringError(ec, "failed to open project config file: %s",
                                   filePath.str().c_str());

  auto result = loadFromYAML((*fileOrErr)->getBuffer());
  if (!result)
    return llvm::createStringError(std::errc::invalid_argument, "%s: %s",
                                   filePath.str().c_str(),
                                   llvm::toString(result.takeError()).c_str());

  // Set root directory to the directory containing the config file
  llvm::SmallString<256> absPath(filePath);
  llvm::sys::fs::make_absolute(absPath);
  (*result)->setRootDirectory(llvm::sys::path::parent_path(absPath));

  return result;
}

llvm::Expected<std::unique_ptr<ProjectConfig>>
ProjectConfig::loadFromYAML(llvm::StringRef yamlContent) {
  auto config = std::make_unique<ProjectConfig>();

  // Handle empty content as valid empty config
  if (yamlContent.trim().empty())
    return std::move(config);

  llvm::SourceMgr srcMgr;
  srcMgr.setDiagHandler([](const llvm::SMDiagnostic &, void *) {});
  llvm::yaml::Stream stream(yamlContent, srcMgr);

  auto docIt = stream.begin();
  if (docIt == stream.end())
    return std::move(config); // Empty config is valid

  auto *root = llvm::dyn_cast_or_null<llvm::yaml::MappingNode>(docIt->getRoot());
  if (!root)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "project config root must be a mapping");

  parseMapping(root, [&](llvm::StringRef key, llvm::yaml::Node *value) {
    auto *mapping = llvm::dyn_cast_or_null<llvm::yaml::MappingNode>(value);

    if (key == "project" && mapping)
      parseProjectInfo(mapping, config->projectInfo);
    else if (key == "files") {
      if (auto *seq = llvm::dyn_cast_or_null<llvm::yaml::SequenceNode>(value))
        parseFiles(seq, config->files);
    } else if (key == "options" && mapping)
      parseOptionMap(mapping, config->options);
    else if (key == "flow_options" && mapping)
      parseOptionMap(mapping, config->flowOptions);
    else if (key == "tool_paths" && mapping)
      parseOptionMap(mapping, config->toolPaths);
    else if (key == "tool_options" && mapping) {
      parseMapping(mapping,
                   [&](llvm::StringRef toolId, llvm::yaml::Node *toolValue) {
                     if (auto *toolMap =
                             llvm::dyn_cast<llvm::yaml::MappingNode>(toolValue))
                       parseOptionMap(toolMap, config->toolOptions[toolId]);
                     return true;
                   });
    }
    return true;
  });

  if (stream.failed())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "malformed YAML in project config");

  return std::move(config);
}

llvm::Expected<std::unique_ptr<ProjectConfig>>
ProjectConfig::findAndLoad(llvm::StringRef directory) {
  llvm::SmallString<256> path;

  for (const auto &name : configFileNames) {
    path = directory;
    llvm::sys::path::append(path, name);

    if (llvm::sys::fs::exists(path))
      return loadFromFile(path);
  }

  return llvm::createStringError(std::errc::no_such_file_or_directory,
                                 "no project configuration file found in: %s",
                                 directory.str().c_str());
}

//===----------------------------------------------------------------------===//
// Accessors
//===----------------------------------------------------------------------===//

const OptionMap *ProjectConfig::getToolOptions(llvm::StringRef toolId) const {
  auto it = toolOptions.find(toolId);
  if (it != toolOptions.end())
    return &it->second;
  return nullptr;
}

//===----------------------------------------------------------------------===//
// Resolution Methods
//===----------------------------------------------------------------------===//

std::string ProjectConfig::resolvePath(llvm::StringRef path) const {
  if (llvm::sys::path::is_absolute(path))
    return path.str();

  if (rootDirectory.empty())
    return path.str();

  llvm::SmallString<256> resolved(rootDirectory);
  llvm::sys::path::append(resolved, path);
  return resolved.str().str();
}

std::string ProjectConfig::getWorkRoot() const {
  if (projectInfo.workRoot.empty())
    return resolvePath("build");
  return resolvePath(projectInfo.workRoot);
}

ProjectMetadata ProjectConfig::getProjectMetadata() const {
  ProjectMetadata metadata;
  metadata.name = projectInfo.name;
  metadata.globalOptions = options;
  for (const auto &entry : toolOptions)
    metadata.stageOptions[entry.first()] = entry.second;
  metadata.files = files;
  return metadata;
}

FlowConfig ProjectConfig::getFlowConfig() const {
  FlowConfig config;
  config.flowOptions = flowOptions;
  config.toolPaths = toolPaths;
  return config;
}

//===----------------------------------------------------------------------===//
// Validation
//===----------------------------------------------------------------------===//

llvm::Error ProjectConfig::validate() const {
  if (projectInfo.name.empty())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "project config does not name the project "
                                   "(project.name)");
  if (projectInfo.flow.empty())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "project config for '%s' does not name a "
                                   "flow (project.flow)",
                                   projectInfo.name.c_str());
  return llvm::Error::success();
}

bool ProjectConfig::isEmpty() const {
  return projectInfo.name.empty() && projectInfo.flow.empty() &&
         projectInfo.workRoot.empty() && files.empty() && options.empty() &&
         flowOptions.empty() && toolOptions.empty() && toolPaths.empty();
}
