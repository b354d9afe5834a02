#pragma once

#include "arrowctl/logging.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

namespace arrowctl {

using TaskId = uint64_t;

/// Never returned by ScheduleAfter.
constexpr TaskId kInvalidTaskId = 0;

/**
 * One-shot timer service used by the server sweep and the client heartbeat
 * and reconnect timers.
 */
class TaskScheduler {
 public:
  using Task = std::function<void()>;

  virtual ~TaskScheduler() = default;

  /// Run `task` once after `delay`.
  virtual TaskId ScheduleAfter(std::chrono::milliseconds delay, Task task) = 0;
  /// Cancel a pending task. A cancelled task never runs. False if not pending.
  virtual bool Cancel(TaskId id) = 0;
};

/**
 * Boost.Asio io_context driven by one dedicated thread.
 *
 * Every ControlServer and ControlClient entry point must run on this thread;
 * other threads hand work over with Post() or RunSync().
 */
class EventLoop : public TaskScheduler {
 public:
  explicit EventLoop(LogCallback log_callback = nullptr);
  /// Stop the loop thread and drop pending tasks.
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  /// Start the loop thread.
  bool Start();
  /// Cancel pending timers, stop the io_context and join the thread.
  void Stop();
  bool IsRunning() const;
  /// True when called from the loop thread.
  bool IsLoopThread() const;

  /// Queue `fn` to run on the loop thread.
  void Post(std::function<void()> fn);
  /**
   * Run `fn` on the loop thread and wait for it to finish. Runs inline when
   * already on the loop thread. Exceptions thrown by `fn` are rethrown here.
   *
   * @return false if the loop is not running.
   */
  bool RunSync(std::function<void()> fn);

  /// Safe to call from any thread; the task runs on the loop thread.
  TaskId ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
  bool Cancel(TaskId id) override;
  /// Number of scheduled tasks that have neither run nor been cancelled.
  size_t PendingTaskCount() const;

  boost::asio::io_context& context();

  /// Return the last Start() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace arrowctl
