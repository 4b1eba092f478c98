#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/Types.hpp"
#include "core/DeployContext.hpp"
#include "core/OperationRecorder.hpp"
#include "inventory/Inventory.hpp"

namespace fleet::facts {
class FactGatherer;
}  // namespace fleet::facts

namespace fleet::transport {
class ITransport;
}  // namespace fleet::transport

namespace fleet::core {

/// Outcome of one operation on one host.
/// Class abbreviation: hr
struct HostResult {
  std::string sHost;
  common::HostOutcome outcome = common::HostOutcome::NoChange;
  std::vector<std::string> vCommands;
  std::string sError;
  bool bTransportError = false;
};

/// Outcome of one operation's dispatch across its hosts.
/// Class abbreviation: opr
struct OperationResult {
  std::string sHash;
  std::string sName;
  std::vector<HostResult> vHosts;
  size_t uApplicable = 0;
  size_t uFailed = 0;
  bool bThresholdExceeded = false;
};

/// Changed / unchanged / failed counts for one host over a run.
/// Class abbreviation: hs
struct HostSummary {
  size_t uChanged = 0;
  size_t uNoChange = 0;
  size_t uFailed = 0;
};

/// Outcome of a whole run.
/// Class abbreviation: rr
struct RunResult {
  common::EngineState state = common::EngineState::Idle;
  std::vector<OperationResult> vOperations;
  std::string sAbortReason;

  size_t failureCount() const;
  std::map<std::string, HostSummary> hostSummaries() const;

  /// 0 only for a Completed run with no recorded host failures.
  int exitCode() const;
};

/// Evaluates a deploy definition into a plan, then executes the plan in
/// global order across the active hosts.
/// State machine: Idle -> Evaluating -> Planned -> Executing -> Completed | Aborted.
/// Class abbreviation: ee
class ExecutionEngine {
 public:
  ExecutionEngine(common::Config cfg, const inventory::Inventory& invHosts,
                  std::shared_ptr<transport::ITransport> spTransport,
                  facts::FactGatherer& fgFacts);
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  /// Run fnDeploy once over the full inventory and freeze the resulting plan.
  /// An exception escaping fnDeploy moves the engine to Aborted and is rethrown.
  void evaluate(const DeployFn& fnDeploy);

  /// Execute the frozen plan. Requires state Planned.
  RunResult execute();

  /// evaluate() followed by execute().
  RunResult run(const DeployFn& fnDeploy);

  common::EngineState state() const { return _state; }
  const OperationRecorder& recorder() const { return _recPlan; }

  /// Hosts eligible for execution: the inventory after the configured limit.
  const inventory::Inventory& activeInventory() const { return _invActive; }

 private:
  void transition(common::EngineState stateNext);

  HostResult executeOnHost(const inventory::Host& host, const std::string& sHash);

  /// Returns false when the run must abort.
  bool dispatchParallel(OperationResult& oprResult,
                        const std::vector<inventory::HostPtr>& vHosts);

  void executeParallel(RunResult& rrResult);
  void executeSerial(RunResult& rrResult);

  bool exceedsThreshold(size_t uFailed, size_t uTotal) const;

  std::vector<inventory::HostPtr> applicableHosts(const common::OperationMeta& omMeta) const;

  common::Config _cfg;
  const inventory::Inventory& _invHosts;
  inventory::Inventory _invActive;
  std::shared_ptr<transport::ITransport> _spTransport;
  facts::FactGatherer& _fgFacts;

  OperationRecorder _recPlan;
  common::EngineState _state = common::EngineState::Idle;
  std::set<std::string> _setFailedHosts;  // dropped from later operations
};

}  // namespace fleet::core
