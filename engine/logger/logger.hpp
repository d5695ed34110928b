#pragma once

#include <string>

namespace vecschema {
namespace engine {

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3
};

class Logger {
 public:
  Logger() = default;
  explicit Logger(const std::string& component) : component_(component) {}

  void Info(const std::string& message) const;
  void Warning(const std::string& message) const;
  void Error(const std::string& message) const;
  void Debug(const std::string& message) const;

  // Process-wide threshold; messages below it are dropped.
  static void SetMinimumLevel(LogLevel level);
  static LogLevel GetMinimumLevel();

  // Parses debug|info|warning|error (case-insensitive).
  static bool ParseLevel(const std::string& name, LogLevel& level);

 private:
  void Log(LogLevel level, const std::string& message) const;

  std::string component_;
};

}  // namespace engine
}  // namespace vecschema
