#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace fleet::common {

/// Run-scoped configuration loaded from FLEET_* environment variables.
/// CLI flags override individual fields after load().
/// Class abbreviation: cfg
struct Config {
  // ── Execution ─────────────────────────────────────────────────────────
  int iParallel = 0;  // 0 = derive from inventory size
  bool bSerial = false;
  int iFailPercent = 0;  // 0 = any failure aborts
  std::optional<std::string> oLimit;
  bool bNoWait = false;
  bool bDryRun = false;

  // ── Transport ─────────────────────────────────────────────────────────
  int iCommandTimeoutSeconds = 0;  // 0 = no timeout
  std::optional<std::string> oSshUser;
  int iSshPort = 22;
  std::optional<std::string> oSshKeyPath;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Inspection ────────────────────────────────────────────────────────
  bool bDebugFacts = false;
  bool bDebugOperations = false;
  bool bDebugData = false;

  /// Load and validate all config from environment variables.
  /// Throws ValidationError on invalid values.
  static Config load();

  /// Throws ValidationError when a field is out of range.
  /// Called by load() and again after CLI overrides are applied.
  void validate() const;

  /// Effective worker count for an inventory of uHostCount hosts.
  size_t resolveParallel(size_t uHostCount) const;

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0), default false.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace fleet::common
