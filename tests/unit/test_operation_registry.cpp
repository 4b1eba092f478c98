#include "operations/OperationRegistry.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using fleet::common::UnknownOperationError;
using fleet::common::ValidationError;
using fleet::operations::OperationRegistry;

TEST(OperationRegistryTest, BuiltinOperationsAreRegistered) {
  const auto& orr = OperationRegistry::builtin();
  EXPECT_EQ(orr.names(), (std::vector<std::string>{"apt.packages", "npm.packages",
                                                   "server.group", "server.shell"}));
  EXPECT_FALSE(orr.get("server.shell").sDescription.empty());
}

TEST(OperationRegistryTest, CreateBuildsSpecFromKeywordArgs) {
  auto osSpec = OperationRegistry::builtin().create(
      "apt.packages", {{"packages", {"nginx", "curl"}}, {"update", true}});
  EXPECT_EQ(osSpec.sName, "apt.packages");
  EXPECT_EQ(osSpec.jArgs["packages"], nlohmann::json::array({"nginx", "curl"}));
  EXPECT_EQ(osSpec.jArgs["update"], true);
  EXPECT_TRUE(static_cast<bool>(osSpec.fnGenerate));
}

TEST(OperationRegistryTest, SingleStringListArgument) {
  auto osSpec = OperationRegistry::builtin().create("server.shell", {{"commands", "uptime"}});
  EXPECT_EQ(osSpec.jArgs["commands"], nlohmann::json::array({"uptime"}));
}

TEST(OperationRegistryTest, UnknownOperationThrows) {
  EXPECT_THROW(OperationRegistry::builtin().create("server.teleport", nlohmann::json::object()),
               UnknownOperationError);
}

TEST(OperationRegistryTest, MissingOrIllTypedArgumentIsValidationError) {
  const auto& orr = OperationRegistry::builtin();
  EXPECT_THROW(orr.create("server.group", nlohmann::json::object()), ValidationError);
  EXPECT_THROW(orr.create("server.shell", {{"commands", 5}}), ValidationError);
  EXPECT_THROW(orr.create("server.group", {{"group", "ops"}, {"present", 3}}), ValidationError);
  EXPECT_THROW(orr.create("server.shell", nlohmann::json::array()), ValidationError);
}

TEST(OperationRegistryTest, CliTokensFillPositionalsThenExtend) {
  const auto& orr = OperationRegistry::builtin();
  auto jArgs = orr.argsFromCli("apt.packages", {"nginx", "curl", "present=false"});
  EXPECT_EQ(jArgs["packages"], nlohmann::json::array({"nginx", "curl"}));
  EXPECT_EQ(jArgs["present"], false);
}

TEST(OperationRegistryTest, CliValueThatIsNotJsonStaysString) {
  auto jArgs = OperationRegistry::builtin().argsFromCli("npm.packages",
                                                        {"pm2", "directory=/srv/app"});
  EXPECT_EQ(jArgs["packages"], "pm2");
  EXPECT_EQ(jArgs["directory"], "/srv/app");
}

TEST(OperationRegistryTest, CliTokenWithSpaceBeforeEqualsIsPositional) {
  auto jArgs = OperationRegistry::builtin().argsFromCli("server.shell", {"echo a=b"});
  EXPECT_EQ(jArgs["commands"], "echo a=b");
}

TEST(OperationRegistryTest, CustomOperationsCanBeAdded) {
  OperationRegistry orr;
  orr.add("custom.noop", {"Does nothing", {}, [](const nlohmann::json& jArgs) {
                            fleet::operations::OperationSpec osSpec;
                            osSpec.sName = "custom.noop";
                            osSpec.jArgs = jArgs;
                            return osSpec;
                          }});
  EXPECT_TRUE(orr.contains("custom.noop"));
  EXPECT_THROW(orr.argsFromCli("custom.noop", {"positional"}), ValidationError);
}
