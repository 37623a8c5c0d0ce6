#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dockapp::modules::battery {

// Values match UPower's UpDeviceState.
enum class State : int {
  Unknown = 0,
  Charging = 1,
  Discharging = 2,
  Empty = 3,
  FullyCharged = 4,
  PendingCharge = 5,
  PendingDischarge = 6,
};

const char* toString(State state);
State stateFromInt(int value);

struct Metrics {
  double fraction{0};
  State state{State::Unknown};
  std::optional<std::chrono::seconds> until_empty;
  std::optional<std::chrono::seconds> until_full;

  bool operator==(const Metrics& other) const {
    return fraction == other.fraction && state == other.state &&
           until_empty == other.until_empty && until_full == other.until_full;
  }
};

// UPower reports a remaining time of 0 when it has no estimate.
Metrics fromDeviceProperties(int state, double percentage, int64_t time_to_empty,
                             int64_t time_to_full);

// Minute precision: "4h3m", "4h", "45m", "0m".
std::string durationString(std::chrono::seconds duration);
// Largest unit only: "4h", "45m", "0m".
std::string shortDurationString(std::chrono::seconds duration);

// Rounds to the nearest integer, halves toward negative infinity.
int roundBiasLow(double x);
std::string percentString(double fraction);

class MetricFormatter {
 public:
  virtual ~MetricFormatter() = default;
  virtual auto format(const Metrics& metrics) const -> std::string = 0;
};

using FormatterPtr = std::shared_ptr<const MetricFormatter>;

class MetricFormatFunc : public MetricFormatter {
 public:
  using Func = std::function<std::string(const Metrics&)>;

  explicit MetricFormatFunc(Func func) : func_(std::move(func)) {}
  auto format(const Metrics& metrics) const -> std::string override { return func_(metrics); }

 private:
  const Func func_;
};

std::string formatState(const Metrics& metrics);
std::string formatPercent(const Metrics& metrics);
// "<duration> left" while charging or discharging, otherwise "Full", "Empty" or "???".
std::string formatRemaining(const Metrics& metrics);

/**
 * Formats metrics through a fmt format string with named arguments:
 *
 *   fraction         charge as a floating point number in [0, 1]
 *   percent          charge as an integral percentage, e.g. "85%"
 *   state            e.g. "Charging", "Discharging", "Full"
 *   remaining        time until full while charging, until empty otherwise
 *   untilFull        time until the battery is full
 *   untilEmpty       time until the battery is empty
 *
 * Each duration also has a `...Short` variant showing only its largest unit. Unknown durations
 * render as "--". Runs of whitespace in the output collapse to a single space.
 *
 * The constructor renders the template once against sample metrics and throws
 * std::invalid_argument when it does not format.
 */
class TemplateFormatter : public MetricFormatter {
 public:
  explicit TemplateFormatter(std::string format);
  auto format(const Metrics& metrics) const -> std::string override;
  const std::string& source() const { return format_; }

 private:
  const std::string format_;
};

std::vector<FormatterPtr> defaultFormatters();

// Builds one TemplateFormatter per template, or the default formatters when there are none.
std::vector<FormatterPtr> makeFormatters(const std::vector<std::string>& templates);

}  // namespace dockapp::modules::battery
