#pragma once

#include <atomic> // Include for std::atomic
#include <cstdio>
#include <cstdlib> // Include for std::getenv
#include <string>
#include <stdexcept> // Include for std::invalid_argument

#include "catalog/collection_definition_builder.hpp"
#include "logger/logger.hpp"
#include "utils/common_util.hpp"
#include "utils/json.hpp"

namespace vecschema {

// ============================================================================
// Environment helpers
// Invalid values fall back to the default with a warning
// ============================================================================

struct ConfigLimits {
  static constexpr bool REQUIRE_VECTOR_FIELD_DEFAULT = true;
  static constexpr bool STRICT_STORAGE_NAMES_DEFAULT = false;
  static constexpr engine::LogLevel LOG_LEVEL_DEFAULT = engine::LogLevel::INFO;

  static bool GetEnvBool(const char* env_name, bool default_value) {
    const char* env_value = std::getenv(env_name);
    if (env_value == nullptr) {
      return default_value;
    }
    bool value = default_value;
    if (!utils::CommonUtil::ParseBool(env_value, value)) {
      printf("[ConfigLimits] Warning: %s=%s invalid boolean, using default %s\n",
             env_name, env_value, default_value ? "true" : "false");
      return default_value;
    }
    return value;
  }

  static engine::LogLevel GetEnvLogLevel(const char* env_name, engine::LogLevel default_value) {
    const char* env_value = std::getenv(env_name);
    if (env_value == nullptr) {
      return default_value;
    }
    engine::LogLevel level = default_value;
    if (!engine::Logger::ParseLevel(env_value, level)) {
      printf("[ConfigLimits] Warning: %s=%s invalid log level, valid values: debug, info, warning, error\n",
             env_name, env_value);
      return default_value;
    }
    return level;
  }
};

inline const char* LogLevelToString(engine::LogLevel level) {
  switch (level) {
    case engine::LogLevel::DEBUG:
      return "debug";
    case engine::LogLevel::INFO:
      return "info";
    case engine::LogLevel::WARNING:
      return "warning";
    case engine::LogLevel::ERROR:
      return "error";
  }
  return "info";
}

// ============================================================================
// Main Configuration Structure
// ============================================================================

struct Config {
  // Reject collection definitions that declare no vector field
  std::atomic<bool> RequireVectorField{ConfigLimits::REQUIRE_VECTOR_FIELD_DEFAULT};
  // Storage names must be plain identifiers
  std::atomic<bool> StrictStorageNames{ConfigLimits::STRICT_STORAGE_NAMES_DEFAULT};
  std::atomic<engine::LogLevel> MinimumLogLevel{ConfigLimits::LOG_LEVEL_DEFAULT};

  Config() {
    const char* env_require = std::getenv("VECSCHEMA_REQUIRE_VECTOR_FIELD");
    bool require = ConfigLimits::GetEnvBool("VECSCHEMA_REQUIRE_VECTOR_FIELD",
                                            ConfigLimits::REQUIRE_VECTOR_FIELD_DEFAULT);
    RequireVectorField.store(require, std::memory_order_release);
    if (env_require != nullptr) {
      printf("[Config] Using VECSCHEMA_REQUIRE_VECTOR_FIELD=%s from environment\n", require ? "true" : "false");
    }

    const char* env_strict = std::getenv("VECSCHEMA_STRICT_STORAGE_NAMES");
    bool strict = ConfigLimits::GetEnvBool("VECSCHEMA_STRICT_STORAGE_NAMES",
                                           ConfigLimits::STRICT_STORAGE_NAMES_DEFAULT);
    StrictStorageNames.store(strict, std::memory_order_release);
    if (env_strict != nullptr) {
      printf("[Config] Using VECSCHEMA_STRICT_STORAGE_NAMES=%s from environment\n", strict ? "true" : "false");
    }

    const char* env_level = std::getenv("VECSCHEMA_LOG_LEVEL");
    engine::LogLevel level = ConfigLimits::GetEnvLogLevel("VECSCHEMA_LOG_LEVEL", ConfigLimits::LOG_LEVEL_DEFAULT);
    MinimumLogLevel.store(level, std::memory_order_release);
    if (env_level != nullptr) {
      printf("[Config] Using VECSCHEMA_LOG_LEVEL=%s from environment\n", LogLevelToString(level));
    }
  }

  void setRequireVectorField(bool value) {
    RequireVectorField.store(value, std::memory_order_release);
  }

  void setStrictStorageNames(bool value) {
    StrictStorageNames.store(value, std::memory_order_release);
  }

  // Setter method for MinimumLogLevel
  void setLogLevel(const std::string& value) {
    engine::LogLevel level;
    if (!engine::Logger::ParseLevel(value, level)) {
      throw std::invalid_argument("Invalid value for LogLevel, valid values: debug, info, warning, error");
    }
    MinimumLogLevel.store(level, std::memory_order_release);
  }

  // Snapshot consumed by CollectionDefinitionBuilder and DefinitionRegistry
  engine::meta::ValidationOptions GetValidationOptions() const {
    engine::meta::ValidationOptions options;
    options.require_vector_field_ = RequireVectorField.load(std::memory_order_acquire);
    options.strict_storage_names_ = StrictStorageNames.load(std::memory_order_acquire);
    return options;
  }

  void ApplyLogLevel() const {
    engine::Logger::SetMinimumLevel(MinimumLogLevel.load(std::memory_order_acquire));
  }

  // A setter function that takes a JSON config, and loop through the keys and values to set the corresponding fields
  void updateConfig(const vecschema::Json& json) {
    if (json.HasMember("RequireVectorField")) {
      if (!json.Get("RequireVectorField").IsBool()) {
        throw std::invalid_argument("Invalid value for RequireVectorField, expected a boolean");
      }
      setRequireVectorField(json.GetBool("RequireVectorField"));
    }
    if (json.HasMember("StrictStorageNames")) {
      if (!json.Get("StrictStorageNames").IsBool()) {
        throw std::invalid_argument("Invalid value for StrictStorageNames, expected a boolean");
      }
      setStrictStorageNames(json.GetBool("StrictStorageNames"));
    }
    if (json.HasMember("LogLevel")) {
      if (!json.Get("LogLevel").IsString()) {
        throw std::invalid_argument("Invalid value for LogLevel, valid values: debug, info, warning, error");
      }
      setLogLevel(json.GetString("LogLevel"));
    }
  }

  // Get current configuration as JSON for debugging
  vecschema::Json getConfigAsJson() const {
    vecschema::Json config = vecschema::Json::MakeObject();
    config.SetBool("RequireVectorField", RequireVectorField.load(std::memory_order_acquire));
    config.SetBool("StrictStorageNames", StrictStorageNames.load(std::memory_order_acquire));
    config.SetString("LogLevel", LogLevelToString(MinimumLogLevel.load(std::memory_order_acquire)));
    return config;
  }
};

}  // namespace vecschema
