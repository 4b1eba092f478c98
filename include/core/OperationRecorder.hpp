#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "operations/OperationSpec.hpp"

namespace fleet::core {

/// Operations recorded during one evaluation pass.
/// Class abbreviation: plan
struct Plan {
  std::map<std::string, common::OperationMeta> mOpMeta;
  std::vector<std::string> vOpOrder;
  std::map<std::string, std::vector<std::string>> mHostOps;
  std::map<std::string, operations::CommandGenerator> mGenerators;
};

/// Deduplicates operations by content hash and assigns each a position in a
/// single global order at first creation. Driven from one thread only.
/// Class abbreviation: rec
class OperationRecorder {
 public:
  OperationRecorder();
  ~OperationRecorder();

  /// Reset to an empty, writable plan.
  void begin();

  /// Record an operation for vTargetHosts and return its hash.
  /// An existing hash gains any new hosts; each newly added host gets the hash
  /// appended to its local list. A new hash takes the next order index.
  /// fnGenerate is kept from the first record of a hash.
  /// Throws PlanFrozenError after finish().
  std::string record(const std::vector<std::string>& vNameStack, const nlohmann::json& jArgs,
                     const std::string& sCallSite, const std::vector<std::string>& vTargetHosts,
                     operations::CommandGenerator fnGenerate = {});

  /// Freeze the plan. Further record() calls throw.
  void finish();
  bool finished() const { return _bFinished; }

  const std::vector<std::string>& opOrder() const { return _plan.vOpOrder; }

  /// Throws ValidationError for an unknown hash.
  const common::OperationMeta& opMeta(const std::string& sHash) const;

  /// Local operation list of a host; empty if it has none.
  const std::vector<std::string>& hostOps(const std::string& sHost) const;

  const Plan& plan() const { return _plan; }

  /// SHA-256 hex digest identifying an operation.
  static std::string computeHash(const std::vector<std::string>& vNameStack,
                                 const nlohmann::json& jArgs, const std::string& sCallSite);

 private:
  Plan _plan;
  bool _bFinished = false;
};

}  // namespace fleet::core
