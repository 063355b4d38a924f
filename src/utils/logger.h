// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_UTILS_LOGGER_H_
#define FUNCMAP_UTILS_LOGGER_H_

#include <iostream>
#include <string>

namespace funcmap {
namespace utils {

// Log levels
enum class LogLevel {
  DEBUG,
  INFO,
  WARNING,
  ERROR,
};

// Process-wide logger
// ERROR goes to stderr and everything else to stdout, unless a sink is set
class Logger {
 public:
  static Logger& Instance();

  void SetLevel(LogLevel level) { level_ = level; }
  LogLevel GetLevel() const { return level_; }

  // Send all levels to sink; nullptr restores stdout/stderr
  void SetSink(std::ostream* sink) { sink_ = sink; }

  void Debug(const std::string& message);
  void Info(const std::string& message);
  void Warning(const std::string& message);
  void Error(const std::string& message);

  // Prevent copying
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

 private:
  Logger() : level_(LogLevel::INFO), sink_(nullptr) {}

  void Log(LogLevel level, const std::string& prefix, const std::string& message);

  LogLevel level_;
  std::ostream* sink_;
};

// Convenience macros
#define LOG_DEBUG(msg) funcmap::utils::Logger::Instance().Debug(msg)
#define LOG_INFO(msg) funcmap::utils::Logger::Instance().Info(msg)
#define LOG_WARNING(msg) funcmap::utils::Logger::Instance().Warning(msg)
#define LOG_ERROR(msg) funcmap::utils::Logger::Instance().Error(msg)

}  // namespace utils
}  // namespace funcmap

#endif  // FUNCMAP_UTILS_LOGGER_H_
