#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fleet::facts {

/// Capability set of one fact type. Each fact is a value of this struct,
/// assembled from plain functions; there is no fact class hierarchy.
/// Class abbreviation: fd
struct FactDefinition {
  std::string sName;
  std::string sDescription;

  /// Probe command for the given argument array.
  std::function<std::string(const nlohmann::json& jArgs)> fnBuildCommand;

  /// Structured value from the probe's stdout lines.
  std::function<nlohmann::json(const std::vector<std::string>& vLines)> fnParse;

  /// Value used when the probe legitimately found nothing.
  std::function<nlohmann::json()> fnDefault;

  /// Tool whose absence means "nothing to find". Checked with a separate
  /// existence probe before the main command runs. Empty function = no check.
  std::function<std::optional<std::string>(const nlohmann::json& jArgs)> fnRequires;

  /// Exit codes of the main probe that mean "nothing found" rather than failure.
  std::vector<int> vAbsentExitCodes;
};

}  // namespace fleet::facts
