#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fleet::common {
struct Config;
}  // namespace fleet::common

namespace fleet::cli {

/// Parsed command line. Options must precede INVENTORY; everything after
/// INVENTORY is the command and its arguments.
/// Class abbreviation: co
struct CliOptions {
  // ── Eager flags ───────────────────────────────────────────────────────
  bool bHelp = false;
  bool bVersion = false;
  bool bListFacts = false;
  bool bListOperations = false;

  // ── Positional ────────────────────────────────────────────────────────
  std::string sInventory;
  std::vector<std::string> vCommand;

  // ── Overrides for Config ──────────────────────────────────────────────
  std::optional<int> oParallel;
  bool bSerial = false;
  std::optional<int> oFailPercent;
  std::optional<std::string> oLimit;
  bool bNoWait = false;
  bool bDryRun = false;
  std::optional<std::string> oUser;
  std::optional<int> oPort;
  std::optional<std::string> oKeyPath;
  std::vector<std::string> vData;  // key=value inventory data overrides

  bool bVerbose = false;
  bool bDebug = false;
  bool bDebugData = false;
  bool bDebugFacts = false;
  bool bDebugOperations = false;

  /// True when one of the eager flags was given.
  bool eager() const { return bHelp || bVersion || bListFacts || bListOperations; }

  /// Copy the given overrides onto cfg and revalidate it.
  /// Throws ValidationError when the result is out of range.
  void applyTo(common::Config& cfg) const;
};

/// Parse argv. Throws ValidationError on unknown options, bad integers,
/// or a missing INVENTORY / COMMAND when no eager flag was given.
CliOptions parseArgs(int argc, char* argv[]);

/// Parse argv given as strings.
CliOptions parseArgs(const std::vector<std::string>& vArgs);

}  // namespace fleet::cli
