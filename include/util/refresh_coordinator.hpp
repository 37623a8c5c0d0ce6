#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "interfaces/ISampleSource.hpp"
#include "util/mailbox.hpp"
#include "util/sleeper_thread.hpp"

namespace dockapp::util {

/**
 * Periodically refreshes a sample source and publishes the most recent value.
 *
 * A refresh is triggered by the timer, by a state notification from the source (when it
 * implements IStateNotifier) or by trigger(). At most one fetch runs at a time: triggers arriving
 * while a fetch is in flight are dropped, not queued. The fetch runs on its own thread so that a
 * slow source never delays timer processing.
 *
 * Every completed fetch offers the latest good value to channel(). A failed fetch is logged and
 * leaves the latest value untouched; the next trigger retries. A fetch throwing SampleSkipped is
 * not a failure: it is logged as a warning and lastError() is left alone.
 *
 * When the source closes its notifications the coordinator keeps refreshing on the timer alone,
 * until a new notification shows they are back.
 */
template <typename Sample>
class RefreshCoordinator {
 public:
  using Source = ISampleSource<Sample>;
  using clock = SleeperThread::clock;

  enum class Status { Idle, Fetching, Stopped };

  RefreshCoordinator(std::shared_ptr<Source> source, clock::duration interval,
                     std::string name = "refresh")
      : source_(std::move(source)),
        notifier_(dynamic_cast<IStateNotifier*>(source_.get())),
        interval_(interval),
        name_(std::move(name)) {
    if (!source_) {
      throw std::invalid_argument(name_ + ": no sample source");
    }
    if (interval_ <= clock::duration::zero()) {
      throw std::invalid_argument(name_ + ": refresh interval must be positive");
    }
  }

  RefreshCoordinator(const RefreshCoordinator&) = delete;
  RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

  // Waits for a fetch still in flight; its result is discarded.
  ~RefreshCoordinator() {
    stop();
    thread_.join();
    if (fetch_thread_.joinable()) {
      fetch_thread_.join();
    }
  }

  /// Primes the latest value with a synchronous fetch, then starts the background loop.
  void start() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (started_ || status_ == Status::Stopped) {
        return;
      }
      started_ = true;
      status_ = Status::Fetching;
      ++fetch_count_;
    }
    complete(runFetch());

    if (notifier_ != nullptr) {
      auto unsubscribe = notifier_->subscribeStateChange([this] { stateChanged(); },
                                                         [this] { notificationsClosed(); });
      std::lock_guard<std::mutex> lock(mutex_);
      unsubscribe_ = std::move(unsubscribe);
    } else {
      spdlog::debug("{}: source has no state notifications, polling only", name_);
    }

    next_tick_ = clock::now() + interval_;
    thread_ = [this] { work(); };
  }

  /// Requests a refresh. Ignored while a fetch is in flight or after stop().
  void trigger() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!started_ || status_ != Status::Idle) {
        return;
      }
      pending_ = true;
    }
    thread_.wake_up();
  }

  void stop() {
    IStateNotifier::Unsubscribe unsubscribe;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (status_ == Status::Stopped) {
        return;
      }
      status_ = Status::Stopped;
      pending_ = false;
      unsubscribe = std::move(unsubscribe_);
      unsubscribe_ = nullptr;
    }
    if (unsubscribe) {
      unsubscribe();
    }
    thread_.stop();
    spdlog::debug("{}: stopped", name_);
  }

  std::optional<Sample> latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
  }

  std::optional<std::string> lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
  }

  std::uint64_t fetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
  }

  Status status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
  }

  bool notificationsEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notifier_ != nullptr && !notifications_closed_;
  }

  const std::string& name() const { return name_; }

  Mailbox<Sample>& channel() { return channel_; }

 private:
  struct Outcome {
    std::optional<Sample> value;
    std::string error;
    bool skipped{false};
  };

  Outcome runFetch() {
    Outcome outcome;
    try {
      outcome.value = source_->fetch();
    } catch (const SampleSkipped& e) {
      outcome.error = e.what();
      outcome.skipped = true;
    } catch (const std::exception& e) {
      outcome.error = e.what();
    }
    return outcome;
  }

  void complete(Outcome outcome) {
    const bool ok = outcome.value.has_value();
    std::optional<Sample> publish;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (status_ == Status::Stopped) {
        return;
      }
      status_ = Status::Idle;
      if (ok) {
        latest_ = std::move(outcome.value);
        last_error_.reset();
      } else if (!outcome.skipped) {
        last_error_ = outcome.error;
      }
      publish = latest_;
    }
    if (outcome.skipped) {
      spdlog::warn("{}: {}", name_, outcome.error);
    } else if (!ok) {
      spdlog::error("{}: {}", name_, outcome.error);
    }
    if (publish) {
      channel_.offer(std::move(*publish));
    }
  }

  void launchFetch() {
    if (fetch_thread_.joinable()) {
      fetch_thread_.join();
    }
    fetch_thread_ = std::thread([this] {
      auto outcome = runFetch();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = std::move(outcome);
      }
      thread_.wake_up();
    });
  }

  void work() {
    thread_.sleep_until(next_tick_);

    std::optional<Outcome> done;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (status_ == Status::Stopped) {
        return;
      }
      done = std::exchange(done_, std::nullopt);
    }
    if (done) {
      fetch_thread_.join();
      complete(std::move(*done));
    }

    const auto now = clock::now();
    bool launch = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (now >= next_tick_) {
        // Ticks missed while suspended collapse into one.
        while (next_tick_ <= now) {
          next_tick_ += interval_;
        }
        if (status_ == Status::Idle) {
          pending_ = true;
        }
      }
      if (pending_ && status_ == Status::Idle) {
        pending_ = false;
        status_ = Status::Fetching;
        ++fetch_count_;
        launch = true;
      }
    }
    if (launch) {
      launchFetch();
    }
  }

  void stateChanged() {
    bool reopened = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (status_ == Status::Stopped) {
        return;
      }
      reopened = std::exchange(notifications_closed_, false);
    }
    if (reopened) {
      spdlog::info("{}: state notifications restored", name_);
    } else {
      spdlog::debug("{}: state change notification", name_);
    }
    trigger();
  }

  void notificationsClosed() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (notifications_closed_) {
        return;
      }
      notifications_closed_ = true;
    }
    spdlog::warn("{}: state notifications closed, refreshing every {}ms only", name_,
                 std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count());
  }

  const std::shared_ptr<Source> source_;
  IStateNotifier* const notifier_;
  const clock::duration interval_;
  const std::string name_;

  mutable std::mutex mutex_;
  Status status_{Status::Idle};
  bool started_{false};
  bool pending_{false};
  bool notifications_closed_{false};
  std::optional<Sample> latest_;
  std::optional<std::string> last_error_;
  std::optional<Outcome> done_;
  std::uint64_t fetch_count_{0};
  IStateNotifier::Unsubscribe unsubscribe_;

  Mailbox<Sample> channel_;
  clock::time_point next_tick_;
  std::thread fetch_thread_;
  SleeperThread thread_;
};

}  // namespace dockapp::util
