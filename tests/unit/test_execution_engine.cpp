#include "core/ExecutionEngine.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "facts/FactGatherer.hpp"
#include "facts/FactRegistry.hpp"
#include "operations/Operations.hpp"
#include "support/FakeTransport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using fleet::common::CommandKind;
using fleet::common::Config;
using fleet::common::EngineState;
using fleet::common::HostOutcome;
using fleet::core::DeployContext;
using fleet::core::ExecutionEngine;
using fleet::core::RunResult;
using fleet::facts::FactGatherer;
using fleet::facts::FactRegistry;
using fleet::test::FakeTransport;
using fleet::test::exitResult;
using fleet::test::hostsInventory;
using fleet::test::okResult;
namespace ops = fleet::operations;

class ExecutionEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _spTransport = std::make_shared<FakeTransport>();
    _upGatherer = std::make_unique<FactGatherer>(_spTransport, FactRegistry::builtin());
  }

  RunResult run(const std::vector<std::string>& vHosts, const fleet::core::DeployFn& fnDeploy) {
    _inv = hostsInventory(vHosts);
    _upEngine = std::make_unique<ExecutionEngine>(_cfg, _inv, _spTransport, *_upGatherer);
    return _upEngine->run(fnDeploy);
  }

  static fleet::core::DeployFn twoShellOps() {
    return [](DeployContext& ctx) {
      ctx.operation(ops::server::shell({"echo one"}), "First");
      ctx.operation(ops::server::shell({"echo two"}), "Second");
    };
  }

  Config _cfg;
  fleet::inventory::Inventory _inv;
  std::shared_ptr<FakeTransport> _spTransport;
  std::unique_ptr<FactGatherer> _upGatherer;
  std::unique_ptr<ExecutionEngine> _upEngine;
};

TEST_F(ExecutionEngineTest, SuccessfulRunCompletes) {
  auto rr = run({"a", "b", "c"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Completed);
  EXPECT_EQ(rr.exitCode(), 0);
  ASSERT_EQ(rr.vOperations.size(), 2u);
  for (const auto& opr : rr.vOperations) {
    EXPECT_EQ(opr.vHosts.size(), 3u);
    for (const auto& hr : opr.vHosts) EXPECT_EQ(hr.outcome, HostOutcome::Changed);
  }
  EXPECT_EQ(_upEngine->state(), EngineState::Completed);
}

TEST_F(ExecutionEngineTest, OperationsRunInGlobalOrderPerHost) {
  run({"a", "b"}, twoShellOps());
  for (const auto& sHost : {"a", "b"}) {
    EXPECT_EQ(_spTransport->commandsFor(sHost, CommandKind::StateChange),
              (std::vector<std::string>{"echo one", "echo two"}));
  }
}

TEST_F(ExecutionEngineTest, AnyFailureAbortsWithDefaultFailPercent) {
  _spTransport->respond("echo one", exitResult(1, "boom"), "b");
  auto rr = run({"a", "b", "c"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Aborted);
  EXPECT_EQ(rr.exitCode(), 1);
  ASSERT_EQ(rr.vOperations.size(), 1u);
  EXPECT_TRUE(rr.vOperations.front().bThresholdExceeded);
  for (const auto& sHost : {"a", "b", "c"}) {
    EXPECT_EQ(_spTransport->countCalls(sHost, "echo two"), 0u);
  }
  EXPECT_FALSE(rr.sAbortReason.empty());
}

TEST_F(ExecutionEngineTest, DryRunSendsNoStateChanges) {
  _spTransport->respond("dpkg -l", okResult({"ii  nginx  1.18.0  amd64  web server"}), "a");
  _cfg.bDryRun = true;

  auto rr = run({"a", "b"}, [](DeployContext& ctx) {
    ctx.operation(ops::apt::packages({"nginx"}));
    ctx.operation(ops::server::shell({"reboot"}));
  });

  EXPECT_EQ(rr.state, EngineState::Completed);
  EXPECT_EQ(_spTransport->countKind(CommandKind::StateChange), 0u);
  EXPECT_GT(_spTransport->countKind(CommandKind::FactProbe), 0u);
  for (const auto& opr : rr.vOperations) {
    for (const auto& hr : opr.vHosts) {
      EXPECT_TRUE(hr.outcome == HostOutcome::WouldChange || hr.outcome == HostOutcome::NoChange);
    }
  }
  const auto& oprApt = rr.vOperations.front();
  ASSERT_EQ(oprApt.vHosts.size(), 2u);
  EXPECT_EQ(oprApt.vHosts[0].outcome, HostOutcome::NoChange);
  EXPECT_EQ(oprApt.vHosts[1].outcome, HostOutcome::WouldChange);
}

TEST_F(ExecutionEngineTest, LimitSkipsOperationsOutsideActiveHosts) {
  _cfg.oLimit = "somehost";
  auto rr = run({"somehost", "anotherhost"}, [](DeployContext& ctx) {
    ctx.onHosts({"anotherhost"}, [](DeployContext& ctxInner) {
      ctxInner.operation(ops::server::shell({"echo elsewhere"}));
    });
    ctx.operation(ops::server::shell({"echo everywhere"}));
  });

  EXPECT_EQ(rr.state, EngineState::Completed);
  EXPECT_EQ(rr.exitCode(), 0);
  ASSERT_EQ(rr.vOperations.size(), 1u);
  ASSERT_EQ(rr.vOperations.front().vHosts.size(), 1u);
  EXPECT_EQ(rr.vOperations.front().vHosts.front().sHost, "somehost");
  EXPECT_TRUE(_spTransport->commandsFor("anotherhost", CommandKind::StateChange).empty());
  EXPECT_EQ(_upEngine->recorder().opOrder().size(), 2u);
}

TEST_F(ExecutionEngineTest, FailPercentToleratesFailuresAndDropsFailedHosts) {
  _cfg.iFailPercent = 50;
  _spTransport->respond("echo one", exitResult(1), "b");
  auto rr = run({"a", "b", "c", "d"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Completed);
  EXPECT_EQ(rr.exitCode(), 1);
  ASSERT_EQ(rr.vOperations.size(), 2u);
  EXPECT_EQ(rr.vOperations[0].uFailed, 1u);
  EXPECT_FALSE(rr.vOperations[0].bThresholdExceeded);
  EXPECT_EQ(rr.vOperations[1].vHosts.size(), 3u);
  EXPECT_EQ(_spTransport->countCalls("b", "echo two"), 0u);

  auto mSummary = rr.hostSummaries();
  EXPECT_EQ(mSummary["b"].uFailed, 1u);
  EXPECT_EQ(mSummary["a"].uChanged, 2u);
}

TEST_F(ExecutionEngineTest, ThresholdCancelsHostsNotYetStarted) {
  _cfg.iParallel = 1;
  _spTransport->respond("echo one", exitResult(1), "a");
  auto rr = run({"a", "b", "c", "d"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Aborted);
  ASSERT_EQ(rr.vOperations.size(), 1u);
  const auto& vHosts = rr.vOperations.front().vHosts;
  ASSERT_EQ(vHosts.size(), 4u);
  EXPECT_EQ(vHosts[0].outcome, HostOutcome::Failed);
  for (size_t i = 1; i < vHosts.size(); ++i) {
    EXPECT_EQ(vHosts[i].outcome, HostOutcome::Cancelled) << vHosts[i].sHost;
  }
  EXPECT_EQ(_spTransport->countKind(CommandKind::StateChange), 1u);
}

TEST_F(ExecutionEngineTest, NoWaitFinishesTheOperationBeforeAborting) {
  _cfg.iParallel = 1;
  _cfg.bNoWait = true;
  _spTransport->respond("echo one", exitResult(1), "a");
  auto rr = run({"a", "b", "c", "d"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Aborted);
  ASSERT_EQ(rr.vOperations.size(), 1u);
  for (const auto& hr : rr.vOperations.front().vHosts) {
    EXPECT_NE(hr.outcome, HostOutcome::Cancelled);
  }
  EXPECT_EQ(_spTransport->countKind(CommandKind::StateChange), 4u);
}

TEST_F(ExecutionEngineTest, ParallelLimitBoundsConcurrency) {
  _cfg.iParallel = 2;
  _spTransport->setDelay(std::chrono::milliseconds(20));
  run({"a", "b", "c", "d", "e"}, [](DeployContext& ctx) {
    ctx.operation(ops::server::shell({"sleep"}));
  });
  EXPECT_LE(_spTransport->peakInFlight(), 2);
}

TEST_F(ExecutionEngineTest, SerialRunsHostByHost) {
  _cfg.bSerial = true;
  auto rr = run({"a", "b"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Completed);
  std::vector<std::string> vOrder;
  for (const auto& rc : _spTransport->calls()) {
    if (rc.kind == CommandKind::StateChange) vOrder.push_back(rc.sHost + ":" + rc.sCommand);
  }
  EXPECT_EQ(vOrder, (std::vector<std::string>{"a:echo one", "a:echo two", "b:echo one",
                                              "b:echo two"}));
  ASSERT_EQ(rr.vOperations.size(), 2u);
  EXPECT_EQ(rr.vOperations[0].vHosts.size(), 2u);
}

TEST_F(ExecutionEngineTest, SerialTransportFailureOnFirstHostIsFatal) {
  _cfg.bSerial = true;
  _cfg.iFailPercent = 100;
  _spTransport->throwOn("a");
  auto rr = run({"a", "b"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Aborted);
  EXPECT_EQ(rr.exitCode(), 1);
  EXPECT_TRUE(_spTransport->commandsFor("b", CommandKind::StateChange).empty());
}

TEST_F(ExecutionEngineTest, SerialFirstHostIsFirstHostWithOperations) {
  _cfg.bSerial = true;
  _cfg.iFailPercent = 100;
  _spTransport->throwOn("a");
  auto rr = run({"idle", "a", "b"}, [](DeployContext& ctx) {
    ctx.onHosts({"a", "b"}, [](DeployContext& ctxScoped) {
      ctxScoped.operation(ops::server::shell({"echo one"}), "First");
    });
  });

  EXPECT_EQ(rr.state, EngineState::Aborted);
  EXPECT_NE(rr.sAbortReason.find("first host a"), std::string::npos);
  EXPECT_TRUE(_spTransport->commandsFor("b", CommandKind::StateChange).empty());
}

TEST_F(ExecutionEngineTest, SerialNoWaitContinuesPastFirstHostTransportFailure) {
  _cfg.bSerial = true;
  _cfg.bNoWait = true;
  _cfg.iFailPercent = 100;
  _spTransport->throwOn("a");
  auto rr = run({"a", "b"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Completed);
  EXPECT_EQ(rr.exitCode(), 1);
  EXPECT_EQ(_spTransport->commandsFor("b", CommandKind::StateChange).size(), 2u);
}

TEST_F(ExecutionEngineTest, TransportErrorIsAHostFailure) {
  _cfg.iFailPercent = 100;
  _spTransport->throwOn("b", "echo one");
  auto rr = run({"a", "b"}, twoShellOps());

  EXPECT_EQ(rr.state, EngineState::Completed);
  const auto& vHosts = rr.vOperations.front().vHosts;
  ASSERT_EQ(vHosts.size(), 2u);
  EXPECT_EQ(vHosts[1].outcome, HostOutcome::Failed);
  EXPECT_TRUE(vHosts[1].bTransportError);
  EXPECT_EQ(rr.vOperations[1].vHosts.size(), 1u);
}

TEST_F(ExecutionEngineTest, FactBasedOperationReportsNoChange) {
  _spTransport->respond("cat /etc/group", okResult({"root:x:0:", "deploy:x:1001:"}), "a");
  auto rr = run({"a", "b"}, [](DeployContext& ctx) {
    ctx.operation(ops::server::group("deploy"));
  });

  EXPECT_EQ(rr.state, EngineState::Completed);
  const auto& vHosts = rr.vOperations.front().vHosts;
  EXPECT_EQ(vHosts[0].outcome, HostOutcome::NoChange);
  EXPECT_EQ(vHosts[1].outcome, HostOutcome::Changed);
  EXPECT_EQ(_spTransport->commandsFor("b", CommandKind::StateChange),
            (std::vector<std::string>{"groupadd 'deploy'"}));
}

TEST_F(ExecutionEngineTest, GeneratorFailureIsAHostFailure) {
  _cfg.iFailPercent = 100;
  _spTransport->respond("cat /etc/group", exitResult(2), "b");
  auto rr = run({"a", "b"}, [](DeployContext& ctx) {
    ctx.operation(ops::server::group("deploy"));
  });

  const auto& vHosts = rr.vOperations.front().vHosts;
  EXPECT_EQ(vHosts[1].outcome, HostOutcome::Failed);
  EXPECT_FALSE(vHosts[1].sError.empty());
}

TEST_F(ExecutionEngineTest, EvaluationErrorAbortsAndPropagates) {
  _inv = hostsInventory({"a"});
  ExecutionEngine ee(_cfg, _inv, _spTransport, *_upGatherer);
  EXPECT_THROW(ee.evaluate([](DeployContext&) { throw std::runtime_error("bad deploy"); }),
               std::runtime_error);
  EXPECT_EQ(ee.state(), EngineState::Aborted);
  EXPECT_EQ(_spTransport->calls().size(), 0u);
}

TEST_F(ExecutionEngineTest, ExecuteRequiresPlannedState) {
  _inv = hostsInventory({"a"});
  ExecutionEngine ee(_cfg, _inv, _spTransport, *_upGatherer);
  EXPECT_THROW(ee.execute(), fleet::common::ValidationError);

  ee.evaluate(twoShellOps());
  EXPECT_EQ(ee.state(), EngineState::Planned);
  EXPECT_TRUE(ee.recorder().finished());
  ee.execute();
  EXPECT_THROW(ee.execute(), fleet::common::ValidationError);
}
