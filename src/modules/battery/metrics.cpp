#include "modules/battery/metrics.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace dockapp::modules::battery {

namespace {

std::string collapseWhitespace(const std::string& text) {
  std::istringstream words(text);
  std::string result;
  for (std::string word; words >> word;) {
    if (!result.empty()) {
      result += ' ';
    }
    result += word;
  }
  return result;
}

std::string durationOrDashes(const std::optional<std::chrono::seconds>& duration, bool shortened) {
  if (!duration) {
    return "--";
  }
  return shortened ? shortDurationString(*duration) : durationString(*duration);
}

const std::optional<std::chrono::seconds>& remaining(const Metrics& metrics) {
  return metrics.state == State::Charging ? metrics.until_full : metrics.until_empty;
}

}  // namespace

const char* toString(State state) {
  switch (state) {
    case State::Charging:
      return "Charging";
    case State::Discharging:
      return "Discharging";
    case State::Empty:
      return "Empty";
    case State::FullyCharged:
      return "Full";
    case State::PendingCharge:
      return "PendingCharge";
    case State::PendingDischarge:
      return "PendingDischarge";
    case State::Unknown:
    default:
      return "Unknown";
  }
}

State stateFromInt(int value) {
  if (value < static_cast<int>(State::Unknown) || value > static_cast<int>(State::PendingDischarge)) {
    return State::Unknown;
  }
  return static_cast<State>(value);
}

Metrics fromDeviceProperties(int state, double percentage, int64_t time_to_empty,
                             int64_t time_to_full) {
  Metrics metrics;
  metrics.fraction = percentage / 100;
  metrics.state = stateFromInt(state);
  if (time_to_empty > 0) {
    metrics.until_empty = std::chrono::seconds(time_to_empty);
  }
  if (time_to_full > 0) {
    metrics.until_full = std::chrono::seconds(time_to_full);
  }
  return metrics;
}

std::string durationString(std::chrono::seconds duration) {
  const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration).count();
  if (minutes == 0) {
    return "0m";
  }
  const std::string sign = minutes < 0 ? "-" : "";
  const auto hours = std::abs(minutes) / 60;
  const auto rest = std::abs(minutes) % 60;
  if (hours == 0) {
    return fmt::format("{}{}m", sign, rest);
  }
  if (rest == 0) {
    return fmt::format("{}{}h", sign, hours);
  }
  return fmt::format("{}{}h{}m", sign, hours, rest);
}

std::string shortDurationString(std::chrono::seconds duration) {
  const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(duration).count();
  if (minutes == 0) {
    return "0m";
  }
  const std::string sign = minutes < 0 ? "-" : "";
  const auto hours = std::abs(minutes) / 60;
  if (hours == 0) {
    return fmt::format("{}{}m", sign, std::abs(minutes));
  }
  return fmt::format("{}{}h", sign, hours);
}

int roundBiasLow(double x) { return static_cast<int>(std::ceil(x - 0.5)); }

std::string percentString(double fraction) {
  return fmt::format("{}%", roundBiasLow(fraction * 100));
}

std::string formatState(const Metrics& metrics) { return toString(metrics.state); }

std::string formatPercent(const Metrics& metrics) { return percentString(metrics.fraction); }

std::string formatRemaining(const Metrics& metrics) {
  switch (metrics.state) {
    case State::Charging:
      return durationOrDashes(metrics.until_full, false) + " left";
    case State::Discharging:
      return durationOrDashes(metrics.until_empty, false) + " left";
    case State::FullyCharged:
      return "Full";
    case State::Empty:
      return "Empty";
    default:
      return "???";
  }
}

TemplateFormatter::TemplateFormatter(std::string format) : format_(std::move(format)) {
  const Metrics sample{.fraction = 0.5,
                       .state = State::Discharging,
                       .until_empty = std::chrono::hours(1),
                       .until_full = std::chrono::minutes(30)};
  try {
    this->format(sample);
  } catch (const fmt::format_error& e) {
    throw std::invalid_argument(fmt::format("template \"{}\": {}", format_, e.what()));
  }
}

auto TemplateFormatter::format(const Metrics& metrics) const -> std::string {
  const auto text = fmt::format(
      fmt::runtime(format_), fmt::arg("fraction", metrics.fraction),
      fmt::arg("percent", percentString(metrics.fraction)),
      fmt::arg("state", toString(metrics.state)),
      fmt::arg("remaining", durationOrDashes(remaining(metrics), false)),
      fmt::arg("remainingShort", durationOrDashes(remaining(metrics), true)),
      fmt::arg("untilFull", durationOrDashes(metrics.until_full, false)),
      fmt::arg("untilFullShort", durationOrDashes(metrics.until_full, true)),
      fmt::arg("untilEmpty", durationOrDashes(metrics.until_empty, false)),
      fmt::arg("untilEmptyShort", durationOrDashes(metrics.until_empty, true)));
  return collapseWhitespace(text);
}

std::vector<FormatterPtr> defaultFormatters() {
  return {std::make_shared<MetricFormatFunc>(formatState),
          std::make_shared<MetricFormatFunc>(formatPercent),
          std::make_shared<MetricFormatFunc>(formatRemaining)};
}

std::vector<FormatterPtr> makeFormatters(const std::vector<std::string>& templates) {
  if (templates.empty()) {
    return defaultFormatters();
  }
  std::vector<FormatterPtr> formatters;
  formatters.reserve(templates.size());
  for (const auto& text : templates) {
    formatters.push_back(std::make_shared<TemplateFormatter>(text));
  }
  return formatters;
}

}  // namespace dockapp::modules::battery
