#include "config/config.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>

using namespace vecschema;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Clear any existing environment variables
    unsetenv("VECSCHEMA_REQUIRE_VECTOR_FIELD");
    unsetenv("VECSCHEMA_STRICT_STORAGE_NAMES");
    unsetenv("VECSCHEMA_LOG_LEVEL");
    saved_level_ = engine::Logger::GetMinimumLevel();
  }

  void TearDown() override {
    unsetenv("VECSCHEMA_REQUIRE_VECTOR_FIELD");
    unsetenv("VECSCHEMA_STRICT_STORAGE_NAMES");
    unsetenv("VECSCHEMA_LOG_LEVEL");
    engine::Logger::SetMinimumLevel(saved_level_);
  }

  engine::LogLevel saved_level_ = engine::LogLevel::INFO;
};

TEST_F(ConfigTest, DefaultConstructor) {
  Config config;

  EXPECT_TRUE(config.RequireVectorField.load());
  EXPECT_FALSE(config.StrictStorageNames.load());
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::INFO);

  auto options = config.GetValidationOptions();
  EXPECT_TRUE(options.require_vector_field_);
  EXPECT_FALSE(options.strict_storage_names_);
}

TEST_F(ConfigTest, EnvironmentVariableOverride) {
  setenv("VECSCHEMA_REQUIRE_VECTOR_FIELD", "false", 1);
  setenv("VECSCHEMA_STRICT_STORAGE_NAMES", "YES", 1);
  setenv("VECSCHEMA_LOG_LEVEL", "Debug", 1);

  Config config;

  EXPECT_FALSE(config.RequireVectorField.load());
  EXPECT_TRUE(config.StrictStorageNames.load());
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::DEBUG);

  auto options = config.GetValidationOptions();
  EXPECT_FALSE(options.require_vector_field_);
  EXPECT_TRUE(options.strict_storage_names_);
}

TEST_F(ConfigTest, InvalidEnvironmentValuesFallBackToDefaults) {
  setenv("VECSCHEMA_REQUIRE_VECTOR_FIELD", "maybe", 1);
  setenv("VECSCHEMA_STRICT_STORAGE_NAMES", "", 1);
  setenv("VECSCHEMA_LOG_LEVEL", "verbose", 1);

  Config config;

  EXPECT_TRUE(config.RequireVectorField.load());
  EXPECT_FALSE(config.StrictStorageNames.load());
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::INFO);
}

TEST_F(ConfigTest, SetLogLevelValidation) {
  Config config;

  config.setLogLevel("warning");
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::WARNING);

  config.setLogLevel("ERROR");
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::ERROR);

  EXPECT_THROW(config.setLogLevel("loud"), std::invalid_argument);
  EXPECT_THROW(config.setLogLevel(""), std::invalid_argument);
  // Failed updates leave the previous value
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::ERROR);
}

TEST_F(ConfigTest, ApplyLogLevel) {
  Config config;
  config.setLogLevel("error");
  config.ApplyLogLevel();
  EXPECT_EQ(engine::Logger::GetMinimumLevel(), engine::LogLevel::ERROR);

  config.setLogLevel("debug");
  config.ApplyLogLevel();
  EXPECT_EQ(engine::Logger::GetMinimumLevel(), engine::LogLevel::DEBUG);
}

TEST_F(ConfigTest, UpdateConfigFromJson) {
  Config config;
  Json update;
  ASSERT_TRUE(update.LoadFromString(
      R"({"RequireVectorField": false, "StrictStorageNames": true, "LogLevel": "warning"})"));

  config.updateConfig(update);

  EXPECT_FALSE(config.RequireVectorField.load());
  EXPECT_TRUE(config.StrictStorageNames.load());
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::WARNING);

  Json bad;
  ASSERT_TRUE(bad.LoadFromString(R"({"LogLevel": "chatty"})"));
  EXPECT_THROW(config.updateConfig(bad), std::invalid_argument);
}

TEST_F(ConfigTest, UpdateConfigRejectsNonBooleanFlags) {
  Config config;
  Json update;
  ASSERT_TRUE(update.LoadFromString(R"({"RequireVectorField": "no"})"));
  EXPECT_THROW(config.updateConfig(update), std::invalid_argument);
  EXPECT_TRUE(config.RequireVectorField.load());

  ASSERT_TRUE(update.LoadFromString(R"({"StrictStorageNames": 1})"));
  EXPECT_THROW(config.updateConfig(update), std::invalid_argument);
  EXPECT_FALSE(config.StrictStorageNames.load());

  ASSERT_TRUE(update.LoadFromString(R"({"LogLevel": 2})"));
  EXPECT_THROW(config.updateConfig(update), std::invalid_argument);
  EXPECT_EQ(config.MinimumLogLevel.load(), engine::LogLevel::INFO);
}

TEST_F(ConfigTest, ConfigAsJson) {
  Config config;
  config.setStrictStorageNames(true);
  auto json = config.getConfigAsJson();
  EXPECT_TRUE(json.GetBool("RequireVectorField"));
  EXPECT_TRUE(json.GetBool("StrictStorageNames"));
  EXPECT_EQ(json.GetString("LogLevel"), "info");
}
