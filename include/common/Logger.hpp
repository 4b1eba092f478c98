#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace fleet::common {

/// Process-wide spdlog logger named "fleet", writing to stderr.
/// stdout is reserved for command output (results, fact JSON, plan dumps).
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("[{}] {} changed", sHost, sOperation);
class Logger {
 public:
  /// Create the logger, or only change its level when already created.
  /// Colors are used when stderr is a terminal.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Returns the logger, creating it at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

  /// Flush and drop all loggers. get() recreates the logger afterwards.
  static void shutdown();

 private:
  static bool _bInitialized;
};

}  // namespace fleet::common
