#pragma once

#include "arrowctl/logging.h"

#include <functional>
#include <memory>
#include <string>

namespace arrowctl {

struct KeyPressOptions {
  /// Number of discrete taps.
  int repeat = 1;
  /// Hold duration per tap in ms; 0 is an instantaneous tap.
  int hold_time_ms = 0;
};

/**
 * OS-level key press capability used by the target to execute commands.
 */
class KeyPressExecutor {
 public:
  /// Receives the outcome of one Press() call.
  using Completion = std::function<void(bool success)>;

  virtual ~KeyPressExecutor() = default;

  /**
   * Press `key_name` ("left" / "right") `options.repeat` times.
   *
   * Must return without waiting for the taps. `done` is invoked exactly once,
   * from any thread, when the presses have finished or failed. It may be
   * invoked before Press() returns.
   */
  virtual void Press(const std::string& key_name, const KeyPressOptions& options,
                     Completion done) = 0;
};

/**
 * Executor that logs each press from a worker thread, sleeps through the
 * requested hold times and reports success. Presses run one at a time in
 * submission order; presses still queued at destruction never complete.
 */
class LoggingKeyPressExecutor : public KeyPressExecutor {
 public:
  explicit LoggingKeyPressExecutor(LogCallback log_callback = nullptr);
  ~LoggingKeyPressExecutor() override;

  LoggingKeyPressExecutor(const LoggingKeyPressExecutor&) = delete;
  LoggingKeyPressExecutor& operator=(const LoggingKeyPressExecutor&) = delete;

  void Press(const std::string& key_name, const KeyPressOptions& options,
             Completion done) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace arrowctl
