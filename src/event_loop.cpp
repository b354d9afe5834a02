#include "arrowctl/event_loop.h"

#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace arrowctl {

namespace asio = boost::asio;

struct EventLoop::Impl {
  explicit Impl(LogCallback log_callback)
      : logger_("EventLoop", std::move(log_callback)) {}

  struct TimerEntry {
    std::shared_ptr<asio::steady_timer> timer;
    Task task;
  };

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    start_error_.clear();
    if (io_.stopped()) {
      io_.restart();
    }
    work_.emplace(asio::make_work_guard(io_));
    try {
      thread_ = std::thread([this]() { Run(); });
    } catch (const std::system_error& ex) {
      start_error_ = std::string("thread start failed: ") + ex.what();
      logger_.Error(start_error_);
      work_.reset();
      running_ = false;
      return false;
    }
    return true;
  }

  void Stop() {
    if (IsLoopThread()) {
      logger_.Error("Stop() called from the loop thread; ignoring");
      return;
    }
    if (!running_.exchange(false)) {
      return;
    }
    work_.reset();
    io_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
    {
      std::lock_guard<std::mutex> lock(thread_id_mutex_);
      loop_thread_id_ = std::thread::id();
    }
    std::lock_guard<std::mutex> lock(timers_mutex_);
    for (auto& entry : timers_) {
      entry.second.timer->cancel();
    }
    timers_.clear();
  }

  void Run() {
    {
      std::lock_guard<std::mutex> lock(thread_id_mutex_);
      loop_thread_id_ = std::this_thread::get_id();
    }
    while (running_) {
      try {
        io_.run();
        return;
      } catch (const std::exception& ex) {
        logger_.Error(std::string("handler threw exception: ") + ex.what());
      }
    }
  }

  bool IsLoopThread() const {
    std::lock_guard<std::mutex> lock(thread_id_mutex_);
    return loop_thread_id_ == std::this_thread::get_id();
  }

  void RunGuarded(const char* name, const std::function<void()>& fn) {
    try {
      fn();
    } catch (const std::exception& ex) {
      logger_.Error(std::string(name) + " threw exception: " + ex.what());
    }
  }

  void Post(std::function<void()> fn) {
    asio::post(io_, [this, fn = std::move(fn)]() { RunGuarded("posted task", fn); });
  }

  bool RunSync(std::function<void()> fn) {
    if (!running_) {
      return false;
    }
    if (IsLoopThread()) {
      fn();
      return true;
    }
    auto task = std::make_shared<std::packaged_task<void()>>(std::move(fn));
    auto result = task->get_future();
    asio::post(io_, [task]() { (*task)(); });
    while (result.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
      if (!running_) {
        return false;
      }
    }
    result.get();
    return true;
  }

  TaskId ScheduleAfter(std::chrono::milliseconds delay, Task task) {
    const TaskId id = next_id_++;
    auto timer = std::make_shared<asio::steady_timer>(io_, delay);
    {
      std::lock_guard<std::mutex> lock(timers_mutex_);
      timers_[id] = TimerEntry{timer, std::move(task)};
    }
    timer->async_wait([this, id, timer](const boost::system::error_code&) {
      OnTimer(id);
    });
    return id;
  }

  // The map entry, not the timer error code, decides whether the task runs.
  void OnTimer(TaskId id) {
    Task task;
    {
      std::lock_guard<std::mutex> lock(timers_mutex_);
      auto it = timers_.find(id);
      if (it == timers_.end()) {
        return;
      }
      task = std::move(it->second.task);
      timers_.erase(it);
    }
    if (task) {
      RunGuarded("scheduled task", task);
    }
  }

  bool Cancel(TaskId id) {
    std::shared_ptr<asio::steady_timer> timer;
    {
      std::lock_guard<std::mutex> lock(timers_mutex_);
      auto it = timers_.find(id);
      if (it == timers_.end()) {
        return false;
      }
      timer = it->second.timer;
      timers_.erase(it);
    }
    asio::post(io_, [timer]() { timer->cancel(); });
    return true;
  }

  size_t PendingTaskCount() const {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    return timers_.size();
  }

  Logger logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::string start_error_;

  mutable std::mutex thread_id_mutex_;
  std::thread::id loop_thread_id_;

  mutable std::mutex timers_mutex_;
  std::unordered_map<TaskId, TimerEntry> timers_;
  std::atomic<TaskId> next_id_{1};
};

EventLoop::EventLoop(LogCallback log_callback)
    : impl_(new Impl(std::move(log_callback))) {}

EventLoop::~EventLoop() { impl_->Stop(); }

bool EventLoop::Start() { return impl_->Start(); }
void EventLoop::Stop() { impl_->Stop(); }
bool EventLoop::IsRunning() const { return impl_->running_; }
bool EventLoop::IsLoopThread() const { return impl_->IsLoopThread(); }

void EventLoop::Post(std::function<void()> fn) { impl_->Post(std::move(fn)); }

bool EventLoop::RunSync(std::function<void()> fn) {
  return impl_->RunSync(std::move(fn));
}

TaskId EventLoop::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
  return impl_->ScheduleAfter(delay, std::move(task));
}

bool EventLoop::Cancel(TaskId id) { return impl_->Cancel(id); }

size_t EventLoop::PendingTaskCount() const { return impl_->PendingTaskCount(); }

boost::asio::io_context& EventLoop::context() { return impl_->io_; }

std::string EventLoop::GetLastError() const { return impl_->start_error_; }

}  // namespace arrowctl
