#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace dockapp::modules::cpu {

// Index of the idle column in a /proc/stat cpu line.
constexpr std::size_t MODE_IDLE = 3;

struct CpuTime {
  std::string name;
  std::vector<int64_t> in_mode;

  bool operator==(const CpuTime& other) const {
    return name == other.name && in_mode == other.in_mode;
  }
};

using CpuTimes = std::vector<CpuTime>;

/**
 * Reads every line of the form `cpu[N] <counter>...`, the aggregate "cpu" line included, in file
 * order. Throws std::runtime_error naming the line when a counter is not a signed 64 bit integer.
 */
CpuTimes parseStat(std::istream& input);
CpuTimes readStat(const std::string& path);

/// True when both samples name the same cpus in the same order with the same number of modes.
bool sameShape(const CpuTimes& a, const CpuTimes& b);

/**
 * Field-wise `curr - prev` for every cpu, names preserved. The samples must have the same shape
 * (std::invalid_argument otherwise). Negative differences are logged, not clamped.
 */
CpuTimes delta(const CpuTimes& prev, const CpuTimes& curr);

/// `1 - in_mode[idle_mode] / sum(in_mode)`; 0 when nothing was accounted.
double utilization(const CpuTime& time, std::size_t idle_mode = MODE_IDLE);

std::vector<std::string> names(const CpuTimes& times);

}  // namespace dockapp::modules::cpu
