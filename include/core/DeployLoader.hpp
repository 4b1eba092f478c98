#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/DeployContext.hpp"
#include "operations/OperationSpec.hpp"

namespace fleet::operations {
class OperationRegistry;
}  // namespace fleet::operations

namespace fleet::core {

/// Per-host condition on a fact value.
/// Class abbreviation: dc
struct DeployCondition {
  std::string sFact;
  nlohmann::json jArgs = nlohmann::json::array();
  nlohmann::json jValue;
  bool bNegate = false;
};

/// One parsed step of a deploy file.
/// Class abbreviation: ds
struct DeployStep {
  enum class Kind { Operation, Include };

  Kind kind = Kind::Operation;
  size_t uIndex = 0;
  std::string sName;
  std::optional<std::vector<std::string>> oHosts;
  std::optional<DeployCondition> oWhen;

  // Operation
  std::string sOp;
  operations::OperationSpec osSpec;

  // Include
  std::string sInclude;
  std::vector<DeployStep> vChildren;
};

/// Loads JSON deploy files into deploy definitions.
///
/// A deploy file is an array of steps:
///   {"name": "...", "op": "server.shell", "args": {...}, "hosts": [...], "when": {...}}
///   {"include": "tasks/a_task.json", "hosts": [...]}
/// Includes are resolved relative to the including file and parsed eagerly, so
/// every error surfaces before evaluation starts.
/// Class abbreviation: dl
class DeployLoader {
 public:
  explicit DeployLoader(const operations::OperationRegistry& orRegistry);
  ~DeployLoader();

  /// Throws DefinitionError ("No deploy file: `<path>`") when sPath is missing,
  /// and DefinitionError for unparseable or invalid content.
  DeployFn load(const std::string& sPath) const;

  /// Parse a deploy document. sFile names it in call sites and errors;
  /// sBaseDir resolves includes.
  std::vector<DeployStep> parse(const nlohmann::json& jDoc, const std::string& sFile,
                                const std::string& sBaseDir,
                                std::vector<std::string>& vIncludeStack) const;

  /// Deploy definition evaluating already-parsed steps.
  static DeployFn toDeploy(std::vector<DeployStep> vSteps, std::string sFile);

 private:
  std::vector<DeployStep> loadFile(const std::string& sPath, const std::string& sDisplayName,
                                   std::vector<std::string>& vIncludeStack) const;

  const operations::OperationRegistry& _orRegistry;
};

}  // namespace fleet::core
