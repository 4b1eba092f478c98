#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace fleet::transport {

/// Spawns a child process and collects its output line by line.
/// Class abbreviation: pr
class ProcessRunner {
 public:
  /// durTimeout of zero disables the timeout.
  explicit ProcessRunner(std::chrono::seconds durTimeout = std::chrono::seconds(0));

  /// Run vArgv (argv[0] resolved through PATH). Returns exit code and output lines.
  /// Throws TransportError when the process cannot be spawned or times out.
  common::CommandResult run(const std::vector<std::string>& vArgv) const;

  /// Run sCommand through /bin/sh -c.
  common::CommandResult runShell(const std::string& sCommand) const;

 private:
  std::chrono::seconds _durTimeout;
};

}  // namespace fleet::transport
