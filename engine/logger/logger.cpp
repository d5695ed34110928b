#include "logger/logger.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

#include "utils/common_util.hpp"

namespace vecschema {
namespace engine {

namespace {

std::atomic<int> minimum_level{static_cast<int>(LogLevel::INFO)};

// Keeps lines from concurrent callers from interleaving.
std::mutex output_mutex;

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

}  // namespace

void Logger::Log(LogLevel level, const std::string& message) const {
  if (static_cast<int>(level) < minimum_level.load(std::memory_order_relaxed)) {
    return;
  }

  std::time_t now = std::time(nullptr);
  std::tm local_time{};
  localtime_r(&now, &local_time);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local_time);

  std::lock_guard<std::mutex> lock(output_mutex);
  std::cout << "[" << timestamp << "] [" << LevelTag(level) << "] ";
  if (!component_.empty()) {
    std::cout << "[" << component_ << "] ";
  }
  std::cout << message << std::endl;
}

void Logger::Error(const std::string& message) const {
  Log(LogLevel::ERROR, message);
}

void Logger::Info(const std::string& message) const {
  Log(LogLevel::INFO, message);
}

void Logger::Warning(const std::string& message) const {
  Log(LogLevel::WARNING, message);
}

void Logger::Debug(const std::string& message) const {
  Log(LogLevel::DEBUG, message);
}

void Logger::SetMinimumLevel(LogLevel level) {
  minimum_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::GetMinimumLevel() {
  return static_cast<LogLevel>(minimum_level.load(std::memory_order_relaxed));
}

bool Logger::ParseLevel(const std::string& name, LogLevel& level) {
  auto lower = utils::CommonUtil::ToLowerCase(name);
  if (lower == "debug") {
    level = LogLevel::DEBUG;
  } else if (lower == "info") {
    level = LogLevel::INFO;
  } else if (lower == "warning" || lower == "warn") {
    level = LogLevel::WARNING;
  } else if (lower == "error") {
    level = LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

}  // namespace engine
}  // namespace vecschema
