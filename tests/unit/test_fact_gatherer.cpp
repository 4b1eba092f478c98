#include "facts/FactGatherer.hpp"

#include "common/Errors.hpp"
#include "facts/FactRegistry.hpp"
#include "support/FakeTransport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using fleet::common::CommandKind;
using fleet::common::GatherError;
using fleet::common::UnknownFactError;
using fleet::facts::FactGatherer;
using fleet::facts::FactRegistry;
using fleet::test::FakeTransport;
using fleet::test::exitResult;
using fleet::test::hostsInventory;
using fleet::test::okResult;

class FactGathererTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _spTransport = std::make_shared<FakeTransport>();
    _upGatherer = std::make_unique<FactGatherer>(_spTransport, FactRegistry::builtin());
  }

  std::shared_ptr<FakeTransport> _spTransport;
  std::unique_ptr<FactGatherer> _upGatherer;
  fleet::inventory::Inventory _inv = hostsInventory({"alpha", "beta", "gamma"});
};

TEST_F(FactGathererTest, CachesValuePerHostAndKey) {
  _spTransport->respond("hostname", okResult({"alpha.example.com"}));
  const auto& host = *_inv.get("alpha");

  auto jFirst = _upGatherer->getFact(host, "hostname");
  auto jSecond = _upGatherer->getFact(host, "hostname");

  EXPECT_EQ(jFirst, "alpha.example.com");
  EXPECT_EQ(jFirst, jSecond);
  EXPECT_EQ(_spTransport->countCalls("alpha", "hostname"), 1u);
}

TEST_F(FactGathererTest, DifferentArgsAreDifferentKeys) {
  _spTransport->respond("command -v 'git'", okResult({"/usr/bin/git"}));
  _spTransport->respond("command -v 'vim'", okResult({"/usr/bin/vim"}));
  const auto& host = *_inv.get("alpha");

  EXPECT_EQ(_upGatherer->getFact(host, "which", nlohmann::json::array({"git"})), "/usr/bin/git");
  EXPECT_EQ(_upGatherer->getFact(host, "which", nlohmann::json::array({"vim"})), "/usr/bin/vim");
  EXPECT_EQ(_spTransport->calls().size(), 2u);
}

TEST_F(FactGathererTest, ProbesAreTaggedAsFactProbes) {
  _upGatherer->getFact(*_inv.get("alpha"), "os");
  for (const auto& rc : _spTransport->calls()) {
    EXPECT_EQ(rc.kind, CommandKind::FactProbe);
  }
  EXPECT_EQ(_spTransport->countKind(CommandKind::StateChange), 0u);
}

TEST_F(FactGathererTest, ConcurrentRequestsShareOneProbe) {
  _spTransport->setDelay(std::chrono::milliseconds(50));
  _spTransport->respond("uname -m", okResult({"x86_64"}));
  const auto& host = *_inv.get("beta");

  std::vector<std::future<nlohmann::json>> vFutures;
  for (int i = 0; i < 8; ++i) {
    vFutures.push_back(std::async(std::launch::async, [this, &host]() {
      return _upGatherer->getFact(host, "arch");
    }));
  }
  for (auto& fut : vFutures) {
    EXPECT_EQ(fut.get(), "x86_64");
  }
  EXPECT_EQ(_spTransport->countCalls("beta", "uname -m"), 1u);
}

TEST_F(FactGathererTest, MissingToolResolvesToDefault) {
  _spTransport->respond("command -v 'dpkg'", exitResult(1));
  auto jPackages = _upGatherer->getFact(*_inv.get("alpha"), "deb_packages");

  EXPECT_TRUE(jPackages.is_object());
  EXPECT_TRUE(jPackages.empty());
  EXPECT_EQ(_spTransport->countCalls("alpha", "dpkg -l"), 0u);
}

TEST_F(FactGathererTest, AbsentExitCodeResolvesToDefault) {
  _spTransport->respond("command -v 'missing-tool'", exitResult(1));
  auto jPath =
      _upGatherer->getFact(*_inv.get("alpha"), "which", nlohmann::json::array({"missing-tool"}));
  EXPECT_TRUE(jPath.is_null());
}

TEST_F(FactGathererTest, EmptyOutputResolvesToDefault) {
  _spTransport->respond("cat /etc/group", okResult({}));
  auto jGroups = _upGatherer->getFact(*_inv.get("alpha"), "groups");
  EXPECT_TRUE(jGroups.is_array());
  EXPECT_TRUE(jGroups.empty());
}

TEST_F(FactGathererTest, FailingProbeIsGatherError) {
  _spTransport->respond("cat /etc/group", exitResult(2, "permission denied"));
  EXPECT_THROW(_upGatherer->getFact(*_inv.get("alpha"), "groups"), GatherError);
}

TEST_F(FactGathererTest, TransportFailureIsGatherError) {
  _spTransport->throwOn("alpha");
  EXPECT_THROW(_upGatherer->getFact(*_inv.get("alpha"), "hostname"), GatherError);
}

TEST_F(FactGathererTest, FailuresAreNotCached) {
  _spTransport->respond("hostname", exitResult(2), "alpha");
  const auto& host = *_inv.get("alpha");
  EXPECT_THROW(_upGatherer->getFact(host, "hostname"), GatherError);

  _spTransport->respond("hostname", okResult({"alpha"}), "alpha");
  EXPECT_EQ(_upGatherer->getFact(host, "hostname"), "alpha");
  EXPECT_EQ(_spTransport->countCalls("alpha", "hostname"), 2u);
}

TEST_F(FactGathererTest, UnknownFactThrows) {
  EXPECT_THROW(_upGatherer->getFact(*_inv.get("alpha"), "no_such_fact"), UnknownFactError);
  EXPECT_THROW(_upGatherer->getFacts(_inv.hosts(), "no_such_fact", nlohmann::json::array(), 2),
               UnknownFactError);
}

TEST_F(FactGathererTest, GetFactsMapsFailedHostsToNull) {
  _spTransport->respond("hostname", okResult({"alpha"}), "alpha");
  _spTransport->respond("hostname", okResult({"gamma"}), "gamma");
  _spTransport->throwOn("beta");

  auto mValues = _upGatherer->getFacts(_inv.hosts(), "hostname", nlohmann::json::array(), 3,
                                       FactGatherer::OnFailure::MapToNull);
  ASSERT_EQ(mValues.size(), 3u);
  EXPECT_EQ(mValues["alpha"], "alpha");
  EXPECT_TRUE(mValues["beta"].is_null());
  EXPECT_EQ(mValues["gamma"], "gamma");
}

TEST_F(FactGathererTest, GetFactsPropagatesGatherErrorByDefault) {
  _spTransport->respond("hostname", okResult({"ok"}));
  _spTransport->throwOn("beta");

  EXPECT_THROW(_upGatherer->getFacts(_inv.hosts(), "hostname", nlohmann::json::array(), 3),
               GatherError);
  // Healthy hosts still resolved and stay cached
  _upGatherer->getFact(*_inv.get("alpha"), "hostname");
  EXPECT_EQ(_spTransport->countCalls("alpha", "hostname"), 1u);
}

TEST_F(FactGathererTest, GetFactsRespectsParallelLimit) {
  _spTransport->setDelay(std::chrono::milliseconds(20));
  _upGatherer->getFacts(_inv.hosts(), "os", nlohmann::json::array(), 1);
  EXPECT_EQ(_spTransport->peakInFlight(), 1);
}

TEST_F(FactGathererTest, SnapshotContainsResolvedEntries) {
  _spTransport->respond("uname -s", okResult({"Linux"}));
  _upGatherer->getFact(*_inv.get("gamma"), "os");

  auto jSnapshot = _upGatherer->snapshot();
  EXPECT_EQ(jSnapshot["gamma"][FactGatherer::cacheKey("os", nlohmann::json::array())], "Linux");
}
