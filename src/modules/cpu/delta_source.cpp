#include "modules/cpu/delta_source.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <thread>

namespace dockapp::modules::cpu {

DeltaSource::DeltaSource(std::shared_ptr<ISampleSource<CpuTimes>> raw,
                         std::chrono::milliseconds settle)
    : raw_(std::move(raw)), settle_(settle) {
  if (!raw_) {
    throw std::invalid_argument("cpu: no raw sample source");
  }
}

auto DeltaSource::fetch() -> CpuTimes {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!prev_) {
    prev_ = raw_->fetch();
    std::this_thread::sleep_for(settle_);
  }
  auto curr = raw_->fetch();
  if (!sameShape(*prev_, curr)) {
    const auto cpus = names(curr);
    prev_ = std::move(curr);
    throw ShapeChanged(fmt::format("cpu set changed, new baseline: {}", fmt::join(cpus, ", ")));
  }
  auto result = delta(*prev_, curr);
  prev_ = std::move(curr);
  return result;
}

void DeltaSource::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (prev_) {
    spdlog::debug("cpu: dropping baseline");
  }
  prev_.reset();
}

}  // namespace dockapp::modules::cpu
