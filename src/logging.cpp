#include "arrowctl/logging.h"

#include <iostream>
#include <mutex>
#include <utility>

namespace arrowctl {
namespace {

// Serializes stderr output from the loop and discovery threads.
std::mutex& StderrMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

Logger::Logger(std::string component, LogCallback callback)
    : component_(std::move(component)), callback_(std::move(callback)) {}

void Logger::Debug(const std::string& message) const {
  Log(LogLevel::kDebug, message);
}

void Logger::Info(const std::string& message) const {
  Log(LogLevel::kInfo, message);
}

void Logger::Warn(const std::string& message) const {
  Log(LogLevel::kWarn, message);
}

void Logger::Error(const std::string& message) const {
  Log(LogLevel::kError, message);
}

void Logger::Log(LogLevel level, const std::string& message) const {
  if (callback_) {
    callback_(level, "[" + component_ + "] " + message);
    return;
  }
  if (level == LogLevel::kDebug) {
    return;
  }
  std::lock_guard<std::mutex> lock(StderrMutex());
  std::cerr << "[arrowctl] [" << LogLevelName(level) << "] [" << component_
            << "] " << message << std::endl;
}

void Logger::CallbackException(const char* name) const {
  std::string message = "callback threw exception: ";
  message += name;
  Error(message);
}

}  // namespace arrowctl
