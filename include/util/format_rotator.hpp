#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include "util/mailbox.hpp"
#include "util/sleeper_thread.hpp"

namespace dockapp::util {

/**
 * Round-robin over a fixed list of display formats.
 *
 * The active item is offered to channel() once when started and once after every interval, when
 * the rotator advances. A consumer that reads late may skip items; it never gets the same offer
 * twice. With a single item the same value is simply offered again on every tick.
 */
template <typename Item>
class FormatRotator {
 public:
  using clock = SleeperThread::clock;

  FormatRotator(std::vector<Item> items, clock::duration interval)
      : items_(std::move(items)), interval_(interval) {
    if (items_.empty()) {
      throw std::invalid_argument("format rotation needs at least one format");
    }
    if (interval_ <= clock::duration::zero()) {
      throw std::invalid_argument("format rotation interval must be positive");
    }
  }

  FormatRotator(const FormatRotator&) = delete;
  FormatRotator& operator=(const FormatRotator&) = delete;

  ~FormatRotator() { stop(); }

  void start() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (started_) {
        return;
      }
      started_ = true;
    }
    channel_.offer(current());
    if (items_.size() > 1) {
      spdlog::debug("rotating {} formats every {}ms", items_.size(),
                    std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count());
    }
    next_tick_ = clock::now() + interval_;
    thread_ = [this] { work(); };
  }

  void stop() { thread_.stop(); }

  Item current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_[index_];
  }

  std::size_t index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_;
  }

  std::size_t size() const { return items_.size(); }

  Mailbox<Item>& channel() { return channel_; }

 private:
  void work() {
    thread_.sleep_until(next_tick_);
    if (!thread_.isRunning()) {
      return;
    }
    const auto now = clock::now();
    if (now < next_tick_) {
      return;
    }
    while (next_tick_ <= now) {
      next_tick_ += interval_;
    }
    Item item = [this] {
      std::lock_guard<std::mutex> lock(mutex_);
      index_ = (index_ + 1) % items_.size();
      return items_[index_];
    }();
    channel_.offer(std::move(item));
  }

  const std::vector<Item> items_;
  const clock::duration interval_;

  mutable std::mutex mutex_;
  std::size_t index_{0};
  bool started_{false};

  Mailbox<Item> channel_;
  clock::time_point next_tick_;
  SleeperThread thread_;
};

}  // namespace dockapp::util
