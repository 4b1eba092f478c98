#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace fleet::common {

/// Base error for all application-level exceptions.
/// Carries the process exit code and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Inventory or deploy source missing, unreadable or malformed. Fatal before execution.
struct DefinitionError : AppError {
  explicit DefinitionError(std::string sCode, std::string sMsg)
      : AppError(1, std::move(sCode), std::move(sMsg)) {}
};

/// Invalid configuration value or command line argument.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(1, std::move(sCode), std::move(sMsg)) {}
};

/// Fact probe failed for a reason other than the probed tool being absent.
struct GatherError : AppError {
  explicit GatherError(std::string sCode, std::string sMsg)
      : AppError(1, std::move(sCode), std::move(sMsg)) {}
};

/// Connectivity loss, timeout or spawn failure while talking to a host.
struct TransportError : AppError {
  explicit TransportError(std::string sCode, std::string sMsg)
      : AppError(1, std::move(sCode), std::move(sMsg)) {}
};

/// Attempt to mutate a plan after evaluation finished.
struct PlanFrozenError : AppError {
  explicit PlanFrozenError(std::string sCode, std::string sMsg)
      : AppError(1, std::move(sCode), std::move(sMsg)) {}
};

/// Fact name not present in the fact registry.
struct UnknownFactError : AppError {
  explicit UnknownFactError(std::string sCode, std::string sMsg)
      : AppError(1, std::move(sCode), std::move(sMsg)) {}
};

/// Operation name not present in the operation registry, or bad operation arguments.
struct UnknownOperationError : AppError {
  explicit UnknownOperationError(std::string sCode, std::string sMsg)
      : AppError(1, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace fleet::common
