#include "core/OperationRecorder.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using fleet::common::PlanFrozenError;
using fleet::common::ValidationError;
using fleet::core::OperationRecorder;

namespace {

const std::vector<std::string> kAllHosts = {"a", "b", "c"};

/// True when vSub appears in vSeq in the same relative order.
bool isSubsequence(const std::vector<std::string>& vSub, const std::vector<std::string>& vSeq) {
  auto it = vSeq.begin();
  for (const auto& s : vSub) {
    it = std::find(it, vSeq.end(), s);
    if (it == vSeq.end()) return false;
    ++it;
  }
  return true;
}

}  // namespace

TEST(OperationRecorderTest, GlobalAndLocalOrder) {
  OperationRecorder rec;
  rec.begin();
  const auto sX = rec.record({"X"}, {{"n", 1}}, "deploy:1", kAllHosts);
  const auto sY = rec.record({"Y"}, {{"n", 2}}, "deploy:2", {"b"});
  rec.finish();

  EXPECT_EQ(rec.opOrder(), (std::vector<std::string>{sX, sY}));
  EXPECT_EQ(rec.hostOps("a"), (std::vector<std::string>{sX}));
  EXPECT_EQ(rec.hostOps("b"), (std::vector<std::string>{sX, sY}));
  EXPECT_EQ(rec.hostOps("c"), (std::vector<std::string>{sX}));
}

TEST(OperationRecorderTest, SameIdentityIsRecordedOnce) {
  OperationRecorder rec;
  rec.begin();
  const auto sFirst = rec.record({"X"}, {{"n", 1}}, "deploy:1", {"a"});
  const auto sSecond = rec.record({"X"}, {{"n", 1}}, "deploy:1", {"b"});

  EXPECT_EQ(sFirst, sSecond);
  EXPECT_EQ(rec.opOrder().size(), 1u);
  EXPECT_EQ(rec.opMeta(sFirst).setHosts, (std::set<std::string>{"a", "b"}));
}

TEST(OperationRecorderTest, HashDependsOnNameArgsAndCallSite) {
  const auto sBase = OperationRecorder::computeHash({"X"}, {{"n", 1}}, "deploy:1");
  EXPECT_EQ(sBase.size(), 64u);
  EXPECT_EQ(sBase, OperationRecorder::computeHash({"X"}, {{"n", 1}}, "deploy:1"));
  EXPECT_NE(sBase, OperationRecorder::computeHash({"Z"}, {{"n", 1}}, "deploy:1"));
  EXPECT_NE(sBase, OperationRecorder::computeHash({"X"}, {{"n", 2}}, "deploy:1"));
  EXPECT_NE(sBase, OperationRecorder::computeHash({"X"}, {{"n", 1}}, "deploy:9"));
  EXPECT_NE(sBase, OperationRecorder::computeHash({"inc", "X"}, {{"n", 1}}, "deploy:1"));
}

TEST(OperationRecorderTest, HashIgnoresArgumentKeyOrder) {
  nlohmann::json jFirst = nlohmann::json::object();
  jFirst["a"] = 1;
  jFirst["b"] = 2;
  nlohmann::json jSecond = nlohmann::json::object();
  jSecond["b"] = 2;
  jSecond["a"] = 1;
  EXPECT_EQ(OperationRecorder::computeHash({"X"}, jFirst, "s"),
            OperationRecorder::computeHash({"X"}, jSecond, "s"));
}

TEST(OperationRecorderTest, ScopedOperationOnlyReachesScopedHosts) {
  OperationRecorder rec;
  rec.begin();
  const auto sHash = rec.record({"limited"}, nlohmann::json::object(), "deploy:3", {"c"});

  EXPECT_EQ(rec.opMeta(sHash).setHosts, (std::set<std::string>{"c"}));
  EXPECT_TRUE(rec.hostOps("a").empty());
  EXPECT_TRUE(rec.hostOps("b").empty());
}

TEST(OperationRecorderTest, LocalListsStaySubsequencesOfGlobalOrder) {
  OperationRecorder rec;
  rec.begin();
  const auto sX = rec.record({"X"}, nlohmann::json::object(), "s1", {"a"});
  const auto sY = rec.record({"Y"}, nlohmann::json::object(), "s2", {"b"});
  // b joins X after Y already exists on b
  rec.record({"X"}, nlohmann::json::object(), "s1", {"b"});
  rec.finish();

  EXPECT_EQ(rec.hostOps("b"), (std::vector<std::string>{sX, sY}));
  for (const auto& sHost : {"a", "b"}) {
    EXPECT_TRUE(isSubsequence(rec.hostOps(sHost), rec.opOrder())) << sHost;
  }
}

TEST(OperationRecorderTest, RecordAfterFinishThrows) {
  OperationRecorder rec;
  rec.begin();
  rec.record({"X"}, nlohmann::json::object(), "s1", {"a"});
  rec.finish();

  EXPECT_TRUE(rec.finished());
  EXPECT_THROW(rec.record({"Y"}, nlohmann::json::object(), "s2", {"a"}), PlanFrozenError);
  EXPECT_EQ(rec.opOrder().size(), 1u);
}

TEST(OperationRecorderTest, BeginResetsThePlan) {
  OperationRecorder rec;
  rec.begin();
  rec.record({"X"}, nlohmann::json::object(), "s1", {"a"});
  rec.finish();
  rec.begin();

  EXPECT_FALSE(rec.finished());
  EXPECT_TRUE(rec.opOrder().empty());
  EXPECT_TRUE(rec.hostOps("a").empty());
}

TEST(OperationRecorderTest, OrderIndexAndNamesAreKept) {
  OperationRecorder rec;
  rec.begin();
  rec.record({"first"}, nlohmann::json::object(), "s1", {"a"});
  const auto sHash = rec.record({"tasks/a.json", "second"}, nlohmann::json::object(), "s2", {"a"});

  const auto& omMeta = rec.opMeta(sHash);
  EXPECT_EQ(omMeta.uOrder, 1u);
  EXPECT_EQ(omMeta.displayName(), "tasks/a.json | second");
  EXPECT_THROW(rec.opMeta("deadbeef"), ValidationError);
}
