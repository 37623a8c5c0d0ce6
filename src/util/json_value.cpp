#include "util/json_value.hpp"

#include <fmt/format.h>

#include <sstream>
#include <stdexcept>

namespace dockapp::util {

namespace {

// One week.
constexpr double MAX_INTERVAL_SECONDS = 7 * 24 * 60 * 60;

[[noreturn]] void invalid(const std::string& key, const std::string& expected) {
  throw std::invalid_argument(fmt::format("config: \"{}\" must be {}", key, expected));
}

}  // namespace

Rect geometryValue(const Json::Value& config, const std::string& key, const Rect& fallback) {
  if (!config.isMember(key)) {
    return fallback;
  }
  if (!config[key].isString()) {
    invalid(key, "a geometry string");
  }
  try {
    return parseGeometry(config[key].asString());
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(fmt::format("config: \"{}\": {}", key, e.what()));
  }
}

Color colorValue(const Json::Value& config, const std::string& key, const Color& fallback) {
  if (!config.isMember(key)) {
    return fallback;
  }
  if (!config[key].isString()) {
    invalid(key, "a colour string");
  }
  try {
    return parseColor(config[key].asString());
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(fmt::format("config: \"{}\": {}", key, e.what()));
  }
}

std::string stringValue(const Json::Value& config, const std::string& key,
                        const std::string& fallback) {
  if (!config.isMember(key)) {
    return fallback;
  }
  if (!config[key].isString()) {
    invalid(key, "a string");
  }
  return config[key].asString();
}

int intValue(const Json::Value& config, const std::string& key, int fallback) {
  if (!config.isMember(key)) {
    return fallback;
  }
  if (!config[key].isInt()) {
    invalid(key, "an integer");
  }
  return config[key].asInt();
}

double doubleValue(const Json::Value& config, const std::string& key, double fallback) {
  if (!config.isMember(key)) {
    return fallback;
  }
  if (!config[key].isNumeric()) {
    invalid(key, "a number");
  }
  return config[key].asDouble();
}

std::chrono::milliseconds intervalValue(const Json::Value& config, const std::string& key,
                                        std::chrono::milliseconds fallback) {
  if (!config.isMember(key)) {
    return fallback;
  }
  const auto seconds = doubleValue(config, key, 0);
  if (!(seconds > 0) || seconds > MAX_INTERVAL_SECONDS) {
    invalid(key, fmt::format("a positive number of seconds up to {}", MAX_INTERVAL_SECONDS));
  }
  const auto interval = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
  if (interval <= std::chrono::milliseconds::zero()) {
    invalid(key, "at least one millisecond");
  }
  return interval;
}

std::vector<std::string> stringListValue(const Json::Value& config, const std::string& key) {
  std::vector<std::string> result;
  if (!config.isMember(key)) {
    return result;
  }
  const auto& value = config[key];
  if (value.isString()) {
    std::istringstream stream(value.asString());
    for (std::string item; std::getline(stream, item, ',');) {
      if (!item.empty()) {
        result.push_back(item);
      }
    }
  } else if (value.isArray()) {
    for (const auto& item : value) {
      if (!item.isString()) {
        invalid(key, "a list of strings");
      }
      result.push_back(item.asString());
    }
  } else {
    invalid(key, "a list of strings");
  }
  return result;
}

}  // namespace dockapp::util
