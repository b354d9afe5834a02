#pragma once

#include <functional>
#include <string>

namespace arrowctl {

/**
 * Severity attached to every log line.
 */
enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

/// Receives formatted log lines; the message does not include the level.
using LogCallback = std::function<void(LogLevel, const std::string&)>;

/// Upper-case name of a level ("DEBUG", "INFO", "WARN", "ERROR").
const char* LogLevelName(LogLevel level);

/**
 * Component-scoped logger. Lines are routed to the configured callback, or to
 * stderr as "[arrowctl] [LEVEL] [Component] message" when none is set.
 */
class Logger {
 public:
  Logger(std::string component, LogCallback callback);

  void Debug(const std::string& message) const;
  void Info(const std::string& message) const;
  void Warn(const std::string& message) const;
  void Error(const std::string& message) const;
  void Log(LogLevel level, const std::string& message) const;

  /// Log a user callback that threw, naming the callback.
  void CallbackException(const char* name) const;

  const std::string& component() const { return component_; }

 private:
  std::string component_;
  LogCallback callback_;
};

}  // namespace arrowctl
