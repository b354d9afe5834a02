#include "arrowctl/key_press.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace arrowctl {

struct LoggingKeyPressExecutor::Impl {
  struct Job {
    std::string key_name;
    KeyPressOptions options;
    Completion done;
  };

  explicit Impl(LogCallback log_callback) : logger_("KeyPress", std::move(log_callback)) {}

  void Submit(Job job) {
    bool started = true;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        return;
      }
      if (!worker_.joinable()) {
        try {
          worker_ = std::thread([this]() { Run(); });
        } catch (const std::system_error& ex) {
          logger_.Error(std::string("thread start failed: ") + ex.what());
          started = false;
        }
      }
      if (started) {
        jobs_.push_back(std::move(job));
      }
    }
    if (!started) {
      Finish(job.done, false);
      return;
    }
    cv_.notify_one();
  }

  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
      jobs_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  void Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
      if (stopping_) {
        return;
      }
      Job job = std::move(jobs_.front());
      jobs_.pop_front();
      lock.unlock();
      if (!Execute(job)) {
        return;
      }
      Finish(job.done, true);
      lock.lock();
    }
  }

  // False if shutdown interrupted the hold.
  bool Execute(const Job& job) {
    const auto& options = job.options;
    if (options.hold_time_ms > 0) {
      logger_.Info("Pressing " + job.key_name + " x" + std::to_string(options.repeat) +
                   ", holding " + std::to_string(options.hold_time_ms) + " ms");
    } else {
      logger_.Info("Pressing " + job.key_name + " x" + std::to_string(options.repeat));
    }
    if (options.hold_time_ms <= 0) {
      return true;
    }
    const auto hold = std::chrono::milliseconds(options.hold_time_ms);
    std::unique_lock<std::mutex> lock(mutex_);
    for (int tap = 0; tap < options.repeat; ++tap) {
      if (cv_.wait_for(lock, hold, [this]() { return stopping_; })) {
        return false;
      }
    }
    return true;
  }

  void Finish(const Completion& done, bool success) {
    if (!done) {
      return;
    }
    try {
      done(success);
    } catch (const std::exception&) {
      logger_.CallbackException("KeyPressCompletion");
    }
  }

  Logger logger_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool stopping_ = false;
  std::thread worker_;
};

LoggingKeyPressExecutor::LoggingKeyPressExecutor(LogCallback log_callback)
    : impl_(new Impl(std::move(log_callback))) {}

LoggingKeyPressExecutor::~LoggingKeyPressExecutor() { impl_->Shutdown(); }

void LoggingKeyPressExecutor::Press(const std::string& key_name,
                                    const KeyPressOptions& options, Completion done) {
  impl_->Submit({key_name, options, std::move(done)});
}

}  // namespace arrowctl
