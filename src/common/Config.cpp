#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

namespace fleet::common {

namespace {
constexpr size_t kThreadsPerCore = 4;  // workers mostly block on remote I/O
}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t uPos = 0;
    const int iValue = std::stoi(sValue, &uPos);
    if (uPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw ValidationError("invalid_integer",
                          std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

Config Config::load() {
  Config cfg;

  // ── Execution ──────────────────────────────────────────────────────────
  cfg.iParallel = getEnvInt("FLEET_PARALLEL", 0);
  cfg.bSerial = getEnvBool("FLEET_SERIAL", false);
  cfg.iFailPercent = getEnvInt("FLEET_FAIL_PERCENT", 0);
  const std::string sLimit = getEnv("FLEET_LIMIT");
  if (!sLimit.empty()) {
    cfg.oLimit = sLimit;
  }
  cfg.bNoWait = getEnvBool("FLEET_NO_WAIT", false);
  cfg.bDryRun = getEnvBool("FLEET_DRY_RUN", false);

  // ── Transport ──────────────────────────────────────────────────────────
  cfg.iCommandTimeoutSeconds = getEnvInt("FLEET_COMMAND_TIMEOUT_SECONDS", 0);
  const std::string sSshUser = getEnv("FLEET_SSH_USER");
  if (!sSshUser.empty()) {
    cfg.oSshUser = sSshUser;
  }
  cfg.iSshPort = getEnvInt("FLEET_SSH_PORT", 22);
  const std::string sSshKey = getEnv("FLEET_SSH_KEY");
  if (!sSshKey.empty()) {
    cfg.oSshKeyPath = sSshKey;
  }

  // Logging
  const std::string sLogLevel = getEnv("FLEET_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // Inspection
  cfg.bDebugFacts = getEnvBool("FLEET_DEBUG_FACTS", false);
  cfg.bDebugOperations = getEnvBool("FLEET_DEBUG_OPERATIONS", false);
  cfg.bDebugData = getEnvBool("FLEET_DEBUG_DATA", false);

  cfg.validate();
  return cfg;
}

void Config::validate() const {
  if (iFailPercent < 0 || iFailPercent > 100) {
    throw ValidationError("invalid_fail_percent",
                          "fail_percent must be between 0 and 100 (got " +
                              std::to_string(iFailPercent) + ")");
  }

  if (iParallel < 0) {
    throw ValidationError("invalid_parallel",
                          "parallel must be >= 0 (got " + std::to_string(iParallel) + ")");
  }

  if (iCommandTimeoutSeconds < 0) {
    throw ValidationError("invalid_timeout",
                          "command timeout must be >= 0 (got " +
                              std::to_string(iCommandTimeoutSeconds) + ")");
  }

  if (iSshPort < 1 || iSshPort > 65535) {
    throw ValidationError("invalid_port",
                          "SSH port must be between 1 and 65535 (got " +
                              std::to_string(iSshPort) + ")");
  }
}

size_t Config::resolveParallel(size_t uHostCount) const {
  if (iParallel > 0) {
    return static_cast<size_t>(iParallel);
  }
  const size_t uCores = std::max<size_t>(1, std::thread::hardware_concurrency());
  return std::clamp<size_t>(uHostCount, 1, uCores * kThreadsPerCore);
}

}  // namespace fleet::common
