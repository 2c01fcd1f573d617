#include <gtest/gtest.h>

#include <cstdlib>

#include "../include/configloader.hpp"
#include "../include/configmanager.hpp"
#include "../include/configvalidator.hpp"
#include "../include/enviromentprocessor.hpp"
#include "testutils.hpp"

using nlohmann::json;
using testutils::TempDir;

namespace {

json sampleConfig() {
  return json::parse(R"({
    "defaults": {
      "logging": [{"type": "console", "level": "info"}],
      "flows": [
        {"name": "orders", "sourceDirectory": "/in/orders",
         "targetDirectory": "/out/orders", "pollInterval": 10},
        {"name": "invoices", "sourceDirectory": "$ENV{FBR_TEST_ROOT}/in",
         "targetDirectory": "$ENV{FBR_TEST_ROOT}/out", "enabled": false}
      ]
    },
    "environments": {
      "production": {},
      "development": {
        "logging": [{"type": "sync_file", "level": "debug",
                     "file": "/tmp/filebridge-dev.log"}]
      }
    }
  })");
}

}  // namespace

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ::setenv("FBR_TEST_ROOT", "/srv/bridge", 1);
    path_ = dir_ / "filebridge.json";
    testutils::writeFile(path_, sampleConfig().dump(2));
    ConfigManager::instance().initialize(path_.string());
  }

  void TearDown() override { ::unsetenv("FBR_TEST_ROOT"); }

  TempDir dir_;
  fs::path path_;
};

TEST_F(ConfigManagerTest, MergesEnvironmentOverDefaults) {
  auto &mgr = ConfigManager::instance();

  auto prod = mgr.getMergedConfig("production");
  EXPECT_EQ(prod["logging"][0]["type"], "console");
  ASSERT_EQ(prod["flows"].size(), 2u);

  auto dev = mgr.getMergedConfig("development");
  EXPECT_EQ(dev["logging"][0]["type"], "sync_file");
  EXPECT_EQ(dev["flows"].size(), 2u);
  EXPECT_EQ(mgr.getConfigFilePath(), path_.string());
}

TEST_F(ConfigManagerTest, ExpandsEnvironmentVariables) {
  auto flows = ConfigManager::instance().getFlowConfigs("production");
  ASSERT_EQ(flows.size(), 2u);
  EXPECT_EQ(flows[1].sourceDirectory, "/srv/bridge/in");
  EXPECT_EQ(flows[1].targetDirectory, "/srv/bridge/out");
  EXPECT_FALSE(flows[1].enabled);
  EXPECT_EQ(flows[0].pollInterval, std::chrono::seconds(10));
}

TEST_F(ConfigManagerTest, UnknownEnvironmentThrows) {
  EXPECT_THROW(ConfigManager::instance().getMergedConfig("staging"),
               std::runtime_error);
}

TEST_F(ConfigManagerTest, LoggingConfigDefaultsToEmptyArray) {
  auto cfg = sampleConfig();
  cfg["defaults"].erase("logging");
  testutils::writeFile(path_, cfg.dump());
  ConfigManager::instance().initialize(path_.string());

  auto logging = ConfigManager::instance().getLoggingConfig("production");
  EXPECT_TRUE(logging.is_array());
  EXPECT_TRUE(logging.empty());
}

TEST_F(ConfigManagerTest, CliOverridesPatchRootAndResetCache) {
  auto &mgr = ConfigManager::instance();
  EXPECT_EQ(mgr.getLoggingConfig("production")[0]["level"], "info");

  mgr.applyCliOverrides(
      {{"environments.production.logging",
        R"([{"type":"console","level":"error"}])"},
       {"environments.production.comment", "plain text"}});

  auto merged = mgr.getMergedConfig("production");
  EXPECT_EQ(merged["logging"][0]["level"], "error");
  EXPECT_EQ(merged["comment"], "plain text");
}

TEST_F(ConfigManagerTest, InvalidOverrideRejected) {
  auto &mgr = ConfigManager::instance();
  EXPECT_THROW(mgr.applyCliOverrides({{"defaults", "42"}}), std::runtime_error);
  // Конфигурация не изменилась
  EXPECT_EQ(mgr.getFlowConfigs("production").size(), 2u);
}

TEST_F(ConfigManagerTest, InitializeFailsOnBrokenFile) {
  testutils::writeFile(path_, "{ not json");
  EXPECT_THROW(ConfigManager::instance().initialize(path_.string()),
               std::runtime_error);
  EXPECT_THROW(ConfigManager::instance().initialize(
                   (dir_ / "missing.json").string()),
               std::runtime_error);
}

TEST(ConfigLoaderTest, LoadsFileAndRemembersPath) {
  TempDir dir;
  const auto path = dir / "c.json";
  testutils::writeFile(path, "{\n  // flows come later\n  \"a\": 1 /* one */\n}");

  ConfigLoader loader;
  EXPECT_TRUE(loader.lastLoadedFile().empty());
  auto j = loader.loadFromFile(path.string());
  EXPECT_EQ(j["a"], 1);
  EXPECT_EQ(loader.lastLoadedFile(), path.string());
}

TEST(ConfigLoaderTest, RejectsNonObjectRootAndDirectories) {
  TempDir dir;
  testutils::writeFile(dir / "array.json", "[1, 2]");

  ConfigLoader loader;
  EXPECT_THROW(loader.loadFromFile((dir / "array.json").string()),
               std::runtime_error);
  EXPECT_THROW(loader.loadFromFile(dir.path().string()), std::runtime_error);
  EXPECT_TRUE(loader.lastLoadedFile().empty());
}

TEST(EnvironmentProcessorTest, UnknownVariableLeftUntouched) {
  ::unsetenv("FBR_SURELY_UNSET_VARIABLE");
  ::setenv("FBR_TEST_HOME", "/home/bridge", 1);

  json j = {{"a", "$ENV{FBR_TEST_HOME}/x"},
            {"b", "$ENV{FBR_SURELY_UNSET_VARIABLE}"},
            {"c", json::array({"$ENV{FBR_TEST_HOME}", 5})}};
  EnvironmentProcessor().process(j);

  EXPECT_EQ(j["a"], "/home/bridge/x");
  EXPECT_EQ(j["b"], "$ENV{FBR_SURELY_UNSET_VARIABLE}");
  EXPECT_EQ(j["c"][0], "/home/bridge");
  EXPECT_EQ(j["c"][1], 5);
  ::unsetenv("FBR_TEST_HOME");
}

TEST(EnvironmentProcessorTest, DefaultValueSyntax) {
  ::unsetenv("FBR_SURELY_UNSET_VARIABLE");
  ::setenv("FBR_TEST_EMPTY", "", 1);
  ::setenv("FBR_TEST_HOME", "/home/bridge", 1);
  EnvironmentProcessor processor;

  EXPECT_EQ(processor.expand("$ENV{FBR_SURELY_UNSET_VARIABLE:-/srv}/in"), "/srv/in");
  EXPECT_EQ(processor.expand("$ENV{FBR_TEST_EMPTY:-fallback}"), "fallback");
  EXPECT_EQ(processor.expand("$ENV{FBR_TEST_EMPTY}"), "");
  EXPECT_EQ(processor.expand("$ENV{FBR_TEST_HOME:-/srv}"), "/home/bridge");
  EXPECT_EQ(processor.expand("a$ENV{FBR_TEST_HOME}b$ENV{FBR_TEST_HOME}"),
            "a/home/bridgeb/home/bridge");
  EXPECT_EQ(processor.expand("broken $ENV{FBR_TEST_HOME"), "broken $ENV{FBR_TEST_HOME");

  ::unsetenv("FBR_TEST_EMPTY");
  ::unsetenv("FBR_TEST_HOME");
}

TEST(ConfigValidatorTest, RejectsDuplicateFlowNames) {
  ConfigValidator validator;
  json flows = json::array(
      {json{{"name", "a"}, {"sourceDirectory", "/s"}, {"targetDirectory", "/t"}},
       json{{"name", "a"}, {"sourceDirectory", "/s2"}, {"targetDirectory", "/t2"}}});
  EXPECT_THROW(validator.validateFlows(flows), std::runtime_error);
}

TEST(ConfigValidatorTest, RejectsUnknownLoggerType) {
  ConfigValidator validator;
  EXPECT_THROW(validator.validateLogging(json::array({json{{"type", "syslog"}}})),
               std::runtime_error);
  EXPECT_THROW(
      validator.validateLogging(json::array({json{{"type", "sync_file"}}})),
      std::runtime_error);
  EXPECT_TRUE(validator.validateLogging(
      json::array({json{{"type", "sync_file"}, {"file", "/tmp/x.log"}}})));
}

TEST(ConfigValidatorTest, RequiresRootSections) {
  ConfigValidator validator;
  EXPECT_THROW(validator.validateRoot(json{{"defaults", json::object()}}),
               std::runtime_error);
  EXPECT_TRUE(validator.validateRoot(
      json{{"defaults", json::object()}, {"environments", json::object()}}));
}
