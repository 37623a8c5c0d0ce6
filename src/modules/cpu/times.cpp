#include "modules/cpu/times.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <fstream>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace dockapp::modules::cpu {

namespace {

// Matches `^cpu\d*\s`.
bool isCpuLine(const std::string& line) {
  if (line.compare(0, 3, "cpu") != 0) {
    return false;
  }
  size_t i = 3;
  while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i])) != 0) {
    ++i;
  }
  return i < line.size() && std::isspace(static_cast<unsigned char>(line[i])) != 0;
}

int64_t parseCounter(const std::string& field, const std::string& line) {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
  if (ec != std::errc{} || ptr != field.data() + field.size()) {
    throw std::runtime_error(fmt::format("unable to parse line: \"{}\"", line));
  }
  return value;
}

}  // namespace

CpuTimes parseStat(std::istream& input) {
  CpuTimes times;
  std::string line;
  while (std::getline(input, line)) {
    if (!isCpuLine(line)) {
      continue;
    }
    std::istringstream fields(line);
    CpuTime time;
    fields >> time.name;
    for (std::string field; fields >> field;) {
      time.in_mode.push_back(parseCounter(field, line));
    }
    times.push_back(std::move(time));
  }
  if (input.bad()) {
    throw std::runtime_error("error reading cpu times");
  }
  return times;
}

CpuTimes readStat(const std::string& path) {
  std::ifstream stat(path);
  if (!stat.is_open()) {
    throw std::runtime_error("Can't open " + path);
  }
  return parseStat(stat);
}

bool sameShape(const CpuTimes& a, const CpuTimes& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].name != b[i].name || a[i].in_mode.size() != b[i].in_mode.size()) {
      return false;
    }
  }
  return true;
}

CpuTimes delta(const CpuTimes& prev, const CpuTimes& curr) {
  if (!sameShape(prev, curr)) {
    throw std::invalid_argument("cpu times differ in shape");
  }
  CpuTimes result = curr;
  for (size_t i = 0; i < result.size(); ++i) {
    auto& modes = result[i].in_mode;
    for (size_t mode = 0; mode < modes.size(); ++mode) {
      modes[mode] -= prev[i].in_mode[mode];
      if (modes[mode] < 0) {
        spdlog::warn("{}: mode {} counter went backwards by {}", result[i].name, mode,
                     -modes[mode]);
      }
    }
  }
  return result;
}

double utilization(const CpuTime& time, std::size_t idle_mode) {
  if (idle_mode >= time.in_mode.size()) {
    spdlog::debug("{}: no idle counter", time.name);
    return 0;
  }
  const auto total = std::accumulate(time.in_mode.begin(), time.in_mode.end(), int64_t{0});
  if (total == 0) {
    spdlog::debug("{}: no time accounted in interval", time.name);
    return 0;
  }
  return 1 - static_cast<double>(time.in_mode[idle_mode]) / static_cast<double>(total);
}

std::vector<std::string> names(const CpuTimes& times) {
  std::vector<std::string> result;
  result.reserve(times.size());
  for (const auto& time : times) {
    result.push_back(time.name);
  }
  return result;
}

}  // namespace dockapp::modules::cpu
