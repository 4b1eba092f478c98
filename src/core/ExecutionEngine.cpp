#include "core/ExecutionEngine.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ThreadPool.hpp"
#include "facts/FactGatherer.hpp"
#include "transport/ITransport.hpp"

#include <algorithm>
#include <atomic>
#include <future>

namespace fleet::core {

namespace {

std::string thresholdReason(const OperationResult& oprResult, int iFailPercent) {
  return std::to_string(oprResult.uFailed) + " of " + std::to_string(oprResult.uApplicable) +
         " hosts failed '" + oprResult.sName + "' (fail_percent " +
         std::to_string(iFailPercent) + ")";
}

}  // namespace

// ── RunResult ──────────────────────────────────────────────────────────────

size_t RunResult::failureCount() const {
  size_t uFailed = 0;
  for (const auto& oprResult : vOperations) uFailed += oprResult.uFailed;
  return uFailed;
}

std::map<std::string, HostSummary> RunResult::hostSummaries() const {
  std::map<std::string, HostSummary> mSummaries;
  for (const auto& oprResult : vOperations) {
    for (const auto& hrResult : oprResult.vHosts) {
      auto& hsSummary = mSummaries[hrResult.sHost];
      switch (hrResult.outcome) {
        case common::HostOutcome::Changed:
        case common::HostOutcome::WouldChange:
          ++hsSummary.uChanged;
          break;
        case common::HostOutcome::NoChange:
          ++hsSummary.uNoChange;
          break;
        case common::HostOutcome::Failed:
          ++hsSummary.uFailed;
          break;
        case common::HostOutcome::Cancelled:
          break;
      }
    }
  }
  return mSummaries;
}

int RunResult::exitCode() const {
  return state == common::EngineState::Completed && failureCount() == 0 ? 0 : 1;
}

// ── ExecutionEngine ────────────────────────────────────────────────────────

ExecutionEngine::ExecutionEngine(common::Config cfg, const inventory::Inventory& invHosts,
                                 std::shared_ptr<transport::ITransport> spTransport,
                                 facts::FactGatherer& fgFacts)
    : _cfg(std::move(cfg)),
      _invHosts(invHosts),
      _invActive(_cfg.oLimit ? invHosts.limit(*_cfg.oLimit) : invHosts),
      _spTransport(std::move(spTransport)),
      _fgFacts(fgFacts) {}

ExecutionEngine::~ExecutionEngine() = default;

void ExecutionEngine::transition(common::EngineState stateNext) {
  common::Logger::get()->debug("Engine state: {} -> {}", common::toString(_state),
                               common::toString(stateNext));
  _state = stateNext;
}

void ExecutionEngine::evaluate(const DeployFn& fnDeploy) {
  if (_state != common::EngineState::Idle) {
    throw common::ValidationError("invalid_state", std::string("Cannot evaluate in state ") +
                                                       common::toString(_state));
  }

  transition(common::EngineState::Evaluating);
  _recPlan.begin();

  DeployContext ctx(_invHosts, _recPlan, _fgFacts, _cfg.resolveParallel(_invHosts.size()));
  try {
    fnDeploy(ctx);
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Deploy evaluation failed: {}", ex.what());
    transition(common::EngineState::Aborted);
    throw;
  }

  _recPlan.finish();
  transition(common::EngineState::Planned);
  common::Logger::get()->info("Planned {} operations across {} hosts",
                              _recPlan.opOrder().size(), _invHosts.size());
}

RunResult ExecutionEngine::run(const DeployFn& fnDeploy) {
  evaluate(fnDeploy);
  return execute();
}

bool ExecutionEngine::exceedsThreshold(size_t uFailed, size_t uTotal) const {
  if (uFailed == 0 || uTotal == 0) return false;
  // failed / total > fail_percent / 100, kept in integers
  return uFailed * 100 > static_cast<size_t>(_cfg.iFailPercent) * uTotal;
}

std::vector<inventory::HostPtr> ExecutionEngine::applicableHosts(
    const common::OperationMeta& omMeta) const {
  std::vector<inventory::HostPtr> vHosts;
  for (const auto& spHost : _invActive) {
    if (omMeta.setHosts.count(spHost->name()) != 0 &&
        _setFailedHosts.count(spHost->name()) == 0) {
      vHosts.push_back(spHost);
    }
  }
  return vHosts;
}

HostResult ExecutionEngine::executeOnHost(const inventory::Host& host, const std::string& sHash) {
  auto spLog = common::Logger::get();
  HostResult hrResult;
  hrResult.sHost = host.name();

  const auto& fnGenerate = _recPlan.plan().mGenerators.at(sHash);
  try {
    if (fnGenerate) hrResult.vCommands = fnGenerate(host, _fgFacts);
  } catch (const std::exception& ex) {
    hrResult.outcome = common::HostOutcome::Failed;
    hrResult.sError = ex.what();
    hrResult.bTransportError = dynamic_cast<const common::TransportError*>(&ex) != nullptr;
    spLog->error("[{}] could not generate commands: {}", host.name(), ex.what());
    return hrResult;
  }

  if (hrResult.vCommands.empty()) {
    hrResult.outcome = common::HostOutcome::NoChange;
    return hrResult;
  }

  if (_cfg.bDryRun) {
    hrResult.outcome = common::HostOutcome::WouldChange;
    return hrResult;
  }

  for (const auto& sCommand : hrResult.vCommands) {
    try {
      auto crResult = _spTransport->execute(host, sCommand, common::CommandKind::StateChange);
      if (!crResult.ok()) {
        hrResult.outcome = common::HostOutcome::Failed;
        hrResult.sError = "command exited " + std::to_string(crResult.iExitCode) +
                          (crResult.vStderr.empty() ? "" : ": " + crResult.vStderr.back());
        spLog->error("[{}] {}: {}", host.name(), sCommand, hrResult.sError);
        return hrResult;
      }
    } catch (const common::TransportError& ex) {
      hrResult.outcome = common::HostOutcome::Failed;
      hrResult.sError = ex.what();
      hrResult.bTransportError = true;
      spLog->error("[{}] transport error: {}", host.name(), ex.what());
      return hrResult;
    }
  }

  hrResult.outcome = common::HostOutcome::Changed;
  return hrResult;
}

RunResult ExecutionEngine::execute() {
  if (_state != common::EngineState::Planned) {
    throw common::ValidationError("invalid_state", std::string("Cannot execute in state ") +
                                                       common::toString(_state));
  }

  transition(common::EngineState::Executing);
  RunResult rrResult;

  if (_cfg.bSerial) {
    executeSerial(rrResult);
  } else {
    executeParallel(rrResult);
  }

  rrResult.state = _state == common::EngineState::Aborted ? common::EngineState::Aborted
                                                          : common::EngineState::Completed;
  if (_state != common::EngineState::Aborted) {
    transition(common::EngineState::Completed);
  }

  auto spLog = common::Logger::get();
  if (rrResult.state == common::EngineState::Aborted) {
    spLog->error("Run aborted: {}", rrResult.sAbortReason);
  } else {
    spLog->info("Run completed: {} operations, {} host failures", rrResult.vOperations.size(),
                rrResult.failureCount());
  }
  return rrResult;
}

bool ExecutionEngine::dispatchParallel(OperationResult& oprResult,
                                       const std::vector<inventory::HostPtr>& vHosts) {
  const size_t uTotal = vHosts.size();
  const size_t uWorkers = std::min(_cfg.resolveParallel(_invActive.size()), uTotal);
  std::atomic<bool> bCancel{false};
  std::atomic<size_t> uFailedSoFar{0};

  // Pool per operation: destruction joins the workers, so every started
  // host finishes before the next operation can begin.
  ThreadPool tpPool(static_cast<int>(uWorkers));
  std::vector<std::future<HostResult>> vFutures;
  vFutures.reserve(uTotal);

  for (const auto& spHost : vHosts) {
    vFutures.push_back(tpPool.submit([this, spHost, &sHash = oprResult.sHash, &bCancel,
                                      &uFailedSoFar, uTotal]() {
      if (bCancel.load()) {
        HostResult hrCancelled;
        hrCancelled.sHost = spHost->name();
        hrCancelled.outcome = common::HostOutcome::Cancelled;
        return hrCancelled;
      }

      HostResult hrResult = executeOnHost(*spHost, sHash);
      if (hrResult.outcome == common::HostOutcome::Failed) {
        const size_t uFailed = uFailedSoFar.fetch_add(1) + 1;
        if (!_cfg.bNoWait && exceedsThreshold(uFailed, uTotal)) {
          bCancel.store(true);
        }
      }
      return hrResult;
    }));
  }

  for (auto& futResult : vFutures) {
    oprResult.vHosts.push_back(futResult.get());
  }
  tpPool.shutdown();

  for (const auto& hrResult : oprResult.vHosts) {
    if (hrResult.outcome == common::HostOutcome::Failed) {
      ++oprResult.uFailed;
      _setFailedHosts.insert(hrResult.sHost);
    }
  }

  oprResult.bThresholdExceeded = exceedsThreshold(oprResult.uFailed, uTotal);
  return !oprResult.bThresholdExceeded;
}

void ExecutionEngine::executeParallel(RunResult& rrResult) {
  auto spLog = common::Logger::get();

  for (const auto& sHash : _recPlan.opOrder()) {
    const auto& omMeta = _recPlan.opMeta(sHash);
    auto vHosts = applicableHosts(omMeta);
    if (vHosts.empty()) {
      spLog->debug("Skipping '{}': no active hosts", omMeta.displayName());
      continue;
    }

    spLog->info("Starting operation: {} ({} hosts)", omMeta.displayName(), vHosts.size());

    OperationResult oprResult;
    oprResult.sHash = sHash;
    oprResult.sName = omMeta.displayName();
    oprResult.uApplicable = vHosts.size();

    const bool bContinue = dispatchParallel(oprResult, vHosts);
    rrResult.vOperations.push_back(std::move(oprResult));

    if (!bContinue) {
      const auto& oprLast = rrResult.vOperations.back();
      rrResult.sAbortReason = thresholdReason(oprLast, _cfg.iFailPercent);
      transition(common::EngineState::Aborted);
      return;
    }
  }
}

void ExecutionEngine::executeSerial(RunResult& rrResult) {
  auto spLog = common::Logger::get();

  // One result slot per operation that has active hosts, in global order
  std::map<std::string, size_t> mSlot;
  for (const auto& sHash : _recPlan.opOrder()) {
    const auto& omMeta = _recPlan.opMeta(sHash);
    auto vHosts = applicableHosts(omMeta);
    if (vHosts.empty()) continue;

    OperationResult oprResult;
    oprResult.sHash = sHash;
    oprResult.sName = omMeta.displayName();
    oprResult.uApplicable = vHosts.size();
    mSlot[sHash] = rrResult.vOperations.size();
    rrResult.vOperations.push_back(std::move(oprResult));
  }

  // Hosts that actually ran something; the first of them gets the transport-fatal rule
  size_t uHostsRun = 0;
  bool bAbort = false;
  for (const auto& spHost : _invActive) {
    if (bAbort) break;

    std::vector<std::string> vHostOps;
    for (const auto& sHash : _recPlan.hostOps(spHost->name())) {
      if (mSlot.count(sHash) != 0) vHostOps.push_back(sHash);
    }
    if (vHostOps.empty()) continue;

    const bool bFirstHost = uHostsRun++ == 0;
    spLog->info("Serial: starting host {}", spHost->name());

    for (const auto& sHash : vHostOps) {
      auto& oprResult = rrResult.vOperations[mSlot.at(sHash)];

      HostResult hrResult = executeOnHost(*spHost, sHash);
      const bool bFailed = hrResult.outcome == common::HostOutcome::Failed;
      const bool bTransport = hrResult.bTransportError;
      oprResult.vHosts.push_back(std::move(hrResult));
      if (!bFailed) continue;

      ++oprResult.uFailed;
      _setFailedHosts.insert(spHost->name());

      if (bTransport && bFirstHost && !_cfg.bNoWait) {
        rrResult.sAbortReason = "transport failure on first host " + spHost->name();
        bAbort = true;
      } else if (!_cfg.bNoWait && exceedsThreshold(oprResult.uFailed, oprResult.uApplicable)) {
        oprResult.bThresholdExceeded = true;
        rrResult.sAbortReason = thresholdReason(oprResult, _cfg.iFailPercent);
        bAbort = true;
      }
      break;  // a failed host runs nothing further
    }
  }

  // With no_wait every host ran; the threshold is judged once at the end
  if (!bAbort && _cfg.bNoWait) {
    for (auto& oprResult : rrResult.vOperations) {
      if (!exceedsThreshold(oprResult.uFailed, oprResult.uApplicable)) continue;
      oprResult.bThresholdExceeded = true;
      if (!bAbort) {
        rrResult.sAbortReason = thresholdReason(oprResult, _cfg.iFailPercent);
        bAbort = true;
      }
    }
  }

  if (bAbort) {
    transition(common::EngineState::Aborted);
  }

  // Drop slots for operations no host ended up running
  std::erase_if(rrResult.vOperations,
                [](const OperationResult& oprResult) { return oprResult.vHosts.empty(); });
}

}  // namespace fleet::core
