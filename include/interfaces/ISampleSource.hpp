#pragma once

#include <functional>
#include <stdexcept>

namespace dockapp {

/**
 * Synchronous producer of raw measurements. fetch() may block for as long as the underlying
 * device needs and reports failure by throwing a std::exception.
 */
template <typename Sample>
class ISampleSource {
 public:
  virtual ~ISampleSource() = default;
  virtual auto fetch() -> Sample = 0;
};

// Thrown by fetch() when the source has nothing to report this cycle but is not failing.
class SampleSkipped : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * Optional capability of a sample source: push notification when the observed state changes.
 *
 * on_change may be called from any thread and carries no payload; consumers re-fetch. on_closed
 * is called when the source can no longer deliver notifications. A later on_change means they
 * are available again. The returned callable releases the subscription; neither callback runs
 * after it returns.
 */
class IStateNotifier {
 public:
  using Unsubscribe = std::function<void()>;

  virtual ~IStateNotifier() = default;
  virtual auto subscribeStateChange(std::function<void()> on_change,
                                    std::function<void()> on_closed) -> Unsubscribe = 0;
};

}  // namespace dockapp
