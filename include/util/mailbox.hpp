#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace dockapp::util {

/**
 * Single-slot channel that only ever holds the most recent value.
 *
 * offer() never blocks: an unread value is replaced by the new one, so a slow consumer observes
 * the freshest value rather than a backlog. Consumers either poll() from an event loop (usually
 * woken through the onOffer() callback) or block in take_for().
 */
template <typename T>
class Mailbox {
 public:
  using Notify = std::function<void()>;

  Mailbox() = default;
  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  // Invoked after every accepted offer, on the offering thread, without the lock held.
  void onOffer(Notify notify) {
    std::lock_guard<std::mutex> lock(mutex_);
    notify_ = std::move(notify);
  }

  bool offer(T value) {
    Notify notify;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      slot_ = std::move(value);
      notify = notify_;
    }
    condvar_.notify_all();
    if (notify) {
      notify();
    }
    return true;
  }

  std::optional<T> poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(slot_, std::nullopt);
  }

  template <typename Rep, typename Period>
  std::optional<T> take_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    condvar_.wait_for(lock, timeout, [this] { return slot_.has_value() || closed_; });
    return std::exchange(slot_, std::nullopt);
  }

  bool pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_.has_value();
  }

  // An unread value stays readable after close.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    condvar_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condvar_;
  std::optional<T> slot_;
  bool closed_{false};
  Notify notify_;
};

}  // namespace dockapp::util
