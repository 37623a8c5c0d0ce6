#pragma once

#include <string>
#include <utility>

#include "interfaces/ISampleSource.hpp"
#include "modules/cpu/times.hpp"

namespace dockapp::modules::cpu {

class StatSource : public ISampleSource<CpuTimes> {
 public:
  explicit StatSource(std::string path = "/proc/stat") : path_(std::move(path)) {}
  auto fetch() -> CpuTimes override { return readStat(path_); }
  const std::string& path() const { return path_; }

 private:
  const std::string path_;
};

}  // namespace dockapp::modules::cpu
