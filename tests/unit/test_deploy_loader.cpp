#include "core/DeployLoader.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "core/ExecutionEngine.hpp"
#include "facts/FactGatherer.hpp"
#include "facts/FactRegistry.hpp"
#include "operations/OperationRegistry.hpp"
#include "support/FakeTransport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using fleet::common::DefinitionError;
using fleet::core::DeployLoader;
using fleet::core::ExecutionEngine;
using fleet::facts::FactGatherer;
using fleet::facts::FactRegistry;
using fleet::operations::OperationRegistry;
using fleet::test::FakeTransport;
using fleet::test::hostsInventory;
using fleet::test::okResult;

namespace {

const char* kMainDeploy = R"([
  {"name": "First main operation", "op": "server.shell", "args": {"commands": ["echo first"]}},
  {"name": "Second main operation", "op": "server.shell", "args": {"commands": ["echo second"]},
   "hosts": ["somehost"]},
  {"include": "tasks/a_task.json", "hosts": ["anotherhost"]},
  {"include": "tasks/a_task.json"},
  {"name": "Loop-0 main operation", "op": "server.shell", "args": {"commands": ["echo 0"]}},
  {"name": "Loop-1 main operation", "op": "server.shell", "args": {"commands": ["echo 1"]}},
  {"name": "Third main operation", "op": "server.shell", "args": {"commands": ["echo third"]}},
  {"name": "Order loop 1", "op": "server.shell", "args": {"commands": ["echo loop 1"]}},
  {"name": "2nd Order loop 1", "op": "server.shell", "args": {"commands": ["echo 2nd loop 1"]}},
  {"name": "Order loop 2", "op": "server.shell", "args": {"commands": ["echo loop 2"]}},
  {"name": "2nd Order loop 2", "op": "server.shell", "args": {"commands": ["echo 2nd loop 2"]}},
  {"name": "Final limited operation", "op": "server.shell", "args": {"commands": ["echo final"]},
   "hosts": "somehost"}
])";

const char* kTaskDeploy = R"([
  {"name": "First task operation", "op": "server.shell", "args": {"commands": ["echo task 1"]}},
  {"name": "Second task operation", "op": "server.shell", "args": {"commands": ["echo task 2"]}}
])";

/// Temporary directory removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string sTemplate = (fs::temp_directory_path() / "fleet_deploy_XXXXXX").string();
    if (mkdtemp(sTemplate.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    _path = sTemplate;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(_path, ec);
  }

  std::string write(const std::string& sRelative, const std::string& sContent) const {
    const auto path = _path / sRelative;
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path);
    ofs << sContent;
    return path.string();
  }

  const fs::path& path() const { return _path; }

 private:
  fs::path _path;
};

}  // namespace

class DeployLoaderTest : public ::testing::Test {
 protected:
  DeployLoader _dl{OperationRegistry::builtin()};
  TempDir _dir;
};

TEST_F(DeployLoaderTest, OperationOrderIsIndependentOfHostOrder) {
  const std::string sDeploy = _dir.write("deploy.json", kMainDeploy);
  _dir.write("tasks/a_task.json", kTaskDeploy);

  const std::vector<std::pair<std::string, std::vector<std::string>>> vExpected = {
      {"First main operation", {}},
      {"Second main operation", {"somehost"}},
      {"tasks/a_task.json | First task operation", {"anotherhost"}},
      {"tasks/a_task.json | Second task operation", {"anotherhost"}},
      {"tasks/a_task.json | First task operation", {}},
      {"tasks/a_task.json | Second task operation", {}},
      {"Loop-0 main operation", {}},
      {"Loop-1 main operation", {}},
      {"Third main operation", {}},
      {"Order loop 1", {}},
      {"2nd Order loop 1", {}},
      {"Order loop 2", {}},
      {"2nd Order loop 2", {}},
      {"Final limited operation", {"somehost"}},
  };

  std::vector<std::string> vHosts = {"somehost", "anotherhost", "someotherhost"};
  std::mt19937 rng(1234);

  for (int iRound = 0; iRound < 3; ++iRound) {
    std::shuffle(vHosts.begin(), vHosts.end(), rng);
    auto inv = hostsInventory(vHosts);
    auto spTransport = std::make_shared<FakeTransport>();
    FactGatherer fg(spTransport, FactRegistry::builtin());
    ExecutionEngine ee(fleet::common::Config{}, inv, spTransport, fg);

    ee.evaluate(_dl.load(sDeploy));

    const auto& rec = ee.recorder();
    ASSERT_EQ(rec.opOrder().size(), vExpected.size());
    for (size_t i = 0; i < vExpected.size(); ++i) {
      const auto& sHash = rec.opOrder()[i];
      const auto& [sName, vOnly] = vExpected[i];
      EXPECT_EQ(rec.opMeta(sHash).displayName(), sName) << "position " << i;

      for (const auto& sHost : vHosts) {
        const auto& vOps = rec.hostOps(sHost);
        const bool bExpected =
            vOnly.empty() || std::find(vOnly.begin(), vOnly.end(), sHost) != vOnly.end();
        const bool bPresent = std::find(vOps.begin(), vOps.end(), sHash) != vOps.end();
        EXPECT_EQ(bPresent, bExpected) << sName << " on " << sHost;
      }
    }
  }
}

TEST_F(DeployLoaderTest, MissingFileIsDefinitionError) {
  const std::string sPath = (_dir.path() / "not-a-file.json").string();
  try {
    _dl.load(sPath);
    FAIL() << "expected DefinitionError";
  } catch (const DefinitionError& ex) {
    EXPECT_EQ(std::string(ex.what()), "No deploy file: `" + sPath + "`");
  }
}

TEST_F(DeployLoaderTest, MissingIncludeIsDefinitionError) {
  const std::string sDeploy = _dir.write("deploy.json", R"([{"include": "tasks/nope.json"}])");
  EXPECT_THROW(_dl.load(sDeploy), DefinitionError);
}

TEST_F(DeployLoaderTest, MalformedJsonIsDefinitionError) {
  const std::string sDeploy = _dir.write("deploy.json", "[{\"op\": ");
  EXPECT_THROW(_dl.load(sDeploy), DefinitionError);
}

TEST_F(DeployLoaderTest, UnknownOperationIsDefinitionError) {
  const std::string sDeploy = _dir.write("deploy.json", R"([{"op": "server.teleport"}])");
  EXPECT_THROW(_dl.load(sDeploy), DefinitionError);
}

TEST_F(DeployLoaderTest, MissingOperationArgumentIsDefinitionError) {
  const std::string sDeploy =
      _dir.write("deploy.json", R"([{"op": "server.group", "args": {"present": true}}])");
  try {
    _dl.load(sDeploy);
    FAIL() << "expected DefinitionError";
  } catch (const DefinitionError& ex) {
    EXPECT_EQ(ex._sErrorCode, "deploy_invalid");
    EXPECT_NE(std::string(ex.what()).find("step 1"), std::string::npos);
  }
}

TEST_F(DeployLoaderTest, StepWithoutOpOrIncludeIsDefinitionError) {
  const std::string sDeploy = _dir.write("deploy.json", R"([{"name": "nothing"}])");
  EXPECT_THROW(_dl.load(sDeploy), DefinitionError);
}

TEST_F(DeployLoaderTest, IncludeCycleIsDefinitionError) {
  _dir.write("a.json", R"([{"include": "b.json"}])");
  _dir.write("b.json", R"([{"include": "a.json"}])");
  EXPECT_THROW(_dl.load((_dir.path() / "a.json").string()), DefinitionError);
}

TEST_F(DeployLoaderTest, WhenConditionSelectsHostsByFact) {
  const std::string sDeploy = _dir.write("deploy.json", R"([
    {"name": "Linux only", "op": "server.shell", "args": {"commands": ["echo linux"]},
     "when": {"fact": "os", "equals": "Linux"}},
    {"name": "Not Linux", "op": "server.shell", "args": {"commands": ["echo other"]},
     "when": {"fact": "os", "not_equals": "Linux"}}
  ])");

  auto inv = hostsInventory({"linux1", "bsd1"});
  auto spTransport = std::make_shared<FakeTransport>();
  spTransport->respond("uname -s", okResult({"Linux"}), "linux1");
  spTransport->respond("uname -s", okResult({"FreeBSD"}), "bsd1");
  FactGatherer fg(spTransport, FactRegistry::builtin());
  ExecutionEngine ee(fleet::common::Config{}, inv, spTransport, fg);

  ee.evaluate(_dl.load(sDeploy));

  const auto& rec = ee.recorder();
  ASSERT_EQ(rec.opOrder().size(), 2u);
  EXPECT_EQ(rec.opMeta(rec.opOrder()[0]).setHosts, (std::set<std::string>{"linux1"}));
  EXPECT_EQ(rec.opMeta(rec.opOrder()[1]).setHosts, (std::set<std::string>{"bsd1"}));
  EXPECT_EQ(spTransport->countCalls("linux1", "uname -s"), 1u);
}

TEST_F(DeployLoaderTest, UnreachableHostInWhenConditionAbortsEvaluation) {
  const std::string sDeploy = _dir.write("deploy.json", R"([
    {"name": "Non-Linux cleanup", "op": "server.shell", "args": {"commands": ["rm -rf /opt/x"]},
     "when": {"fact": "os", "not_equals": "Linux"}}
  ])");

  auto inv = hostsInventory({"up", "down"});
  auto spTransport = std::make_shared<FakeTransport>();
  spTransport->respond("uname -s", okResult({"Linux"}));
  spTransport->throwOn("down");
  FactGatherer fg(spTransport, FactRegistry::builtin());
  ExecutionEngine ee(fleet::common::Config{}, inv, spTransport, fg);

  EXPECT_THROW(ee.evaluate(_dl.load(sDeploy)), fleet::common::GatherError);
  EXPECT_EQ(ee.state(), fleet::common::EngineState::Aborted);
  EXPECT_EQ(spTransport->countKind(fleet::common::CommandKind::StateChange), 0u);
}

TEST_F(DeployLoaderTest, ParseReportsStepPosition) {
  std::vector<std::string> vStack;
  try {
    _dl.parse(nlohmann::json::parse(R"([{"op": "server.shell", "args": {"commands": ["x"]}}, 5])"),
              "inline.json", _dir.path().string(), vStack);
    FAIL() << "expected DefinitionError";
  } catch (const DefinitionError& ex) {
    EXPECT_NE(std::string(ex.what()).find("inline.json step 2"), std::string::npos);
  }
}
