#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace dockapp::util {

/**
 * Background thread calling `func` in a loop until stopped.
 *
 * `func` is expected to park itself with one of the sleep methods. A wake_up() that arrives while
 * `func` is busy is remembered and makes the next sleep return immediately, so callers can record
 * an event under their own lock, wake the thread and never lose the event.
 */
class SleeperThread {
 public:
  using clock = std::chrono::steady_clock;

  SleeperThread() = default;

  SleeperThread(std::function<void()> func)
      : thread_{[this, func] {
          while (do_run_) {
            func();
          }
        }} {}

  SleeperThread& operator=(std::function<void()> func) {
    thread_ = std::thread([this, func] {
      while (do_run_) {
        func();
      }
    });
    return *this;
  }

  SleeperThread(const SleeperThread&) = delete;
  SleeperThread& operator=(const SleeperThread&) = delete;

  bool isRunning() const { return do_run_; }

  /// Returns true when woken up or stopped, false on timeout.
  bool sleep() {
    std::unique_lock lk(mutex_);
    condvar_.wait(lk, [this] { return signal_ || !do_run_; });
    signal_ = false;
    return true;
  }

  bool sleep_for(clock::duration dur) {
    constexpr auto max_time_point = clock::time_point::max();
    auto wait_end = max_time_point;
    auto now = clock::now();
    if (now < max_time_point - dur) {
      wait_end = now + dur;
    }
    return sleep_until(wait_end);
  }

  bool sleep_until(clock::time_point time_point) {
    std::unique_lock lk(mutex_);
    auto woken = condvar_.wait_until(lk, time_point, [this] { return signal_ || !do_run_; });
    signal_ = false;
    return woken;
  }

  void wake_up() {
    {
      std::lock_guard<std::mutex> lck(mutex_);
      signal_ = true;
    }
    condvar_.notify_all();
  }

  // Returns immediately; the loop exits once the current call to func returns.
  void stop() {
    {
      std::lock_guard<std::mutex> lck(mutex_);
      signal_ = true;
      do_run_ = false;
    }
    condvar_.notify_all();
  }

  void join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  ~SleeperThread() {
    stop();
    join();
  }

 private:
  std::thread thread_;
  std::condition_variable condvar_;
  std::mutex mutex_;
  std::atomic<bool> do_run_ = true;
  bool signal_ = false;
};

}  // namespace dockapp::util
