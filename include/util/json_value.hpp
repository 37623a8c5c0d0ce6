#pragma once

#include <json/json.h>

#include <chrono>
#include <string>
#include <vector>

#include "util/color.hpp"
#include "util/geometry.hpp"

namespace dockapp::util {

// Typed lookups into a configuration object. A missing key yields `fallback`; a value of the
// wrong type or format throws std::invalid_argument naming the key.

Rect geometryValue(const Json::Value& config, const std::string& key, const Rect& fallback);
Color colorValue(const Json::Value& config, const std::string& key, const Color& fallback);
std::string stringValue(const Json::Value& config, const std::string& key,
                        const std::string& fallback);
int intValue(const Json::Value& config, const std::string& key, int fallback);
double doubleValue(const Json::Value& config, const std::string& key, double fallback);

// Seconds, fractions allowed; must be positive and at most one week.
std::chrono::milliseconds intervalValue(const Json::Value& config, const std::string& key,
                                        std::chrono::milliseconds fallback);

// Either an array of strings or a single comma separated string.
std::vector<std::string> stringListValue(const Json::Value& config, const std::string& key);

}  // namespace dockapp::util
