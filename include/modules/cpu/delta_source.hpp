#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include "interfaces/ISampleSource.hpp"
#include "modules/cpu/times.hpp"

namespace dockapp::modules::cpu {

// The set of cpus changed between two samples; the newer sample is the new baseline.
class ShapeChanged : public SampleSkipped {
 public:
  using SampleSkipped::SampleSkipped;
};

/**
 * Turns a source of cumulative cpu counters into a source of per-interval differences.
 *
 * The first fetch records a baseline, waits `settle` and samples again so that even the first
 * result covers a real interval. reset() is meant for resume from suspend, when the next
 * difference would otherwise span the whole sleep.
 */
class DeltaSource : public ISampleSource<CpuTimes> {
 public:
  explicit DeltaSource(std::shared_ptr<ISampleSource<CpuTimes>> raw,
                       std::chrono::milliseconds settle = std::chrono::milliseconds(100));

  auto fetch() -> CpuTimes override;

  // Drops the baseline; the next fetch primes again.
  void reset();

 private:
  const std::shared_ptr<ISampleSource<CpuTimes>> raw_;
  const std::chrono::milliseconds settle_;

  std::mutex mutex_;
  std::optional<CpuTimes> prev_;
};

}  // namespace dockapp::modules::cpu
