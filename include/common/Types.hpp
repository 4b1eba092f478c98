#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace fleet::common {

/// Tags every transport call so callers can tell probes from changes.
enum class CommandKind { FactProbe, StateChange };

/// Result of a single command executed through a transport.
/// Class abbreviation: cr
struct CommandResult {
  int iExitCode = 0;
  std::vector<std::string> vStdout;
  std::vector<std::string> vStderr;

  bool ok() const { return iExitCode == 0; }
};

/// Outcome of one operation on one host.
enum class HostOutcome { NoChange, Changed, WouldChange, Failed, Cancelled };

/// Lifecycle of a single run.
enum class EngineState { Idle, Evaluating, Planned, Executing, Completed, Aborted };

/// Planning metadata for one deduplicated operation.
/// Class abbreviation: om
struct OperationMeta {
  std::string sHash;
  std::vector<std::string> vNameStack;
  size_t uOrder = 0;
  std::set<std::string> setHosts;

  /// Name stack joined with " | ", e.g. "tasks/a_task.json | First task operation".
  std::string displayName() const;
};

const char* toString(CommandKind kind);
const char* toString(HostOutcome outcome);
const char* toString(EngineState state);

}  // namespace fleet::common
