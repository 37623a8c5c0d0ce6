#pragma once

#include <clara.hpp>
#include <json/json.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "AApp.hpp"
#include "modules/cpu/delta_source.hpp"
#include "modules/cpu/times.hpp"
#include "util/refresh_coordinator.hpp"

namespace dockapp::modules {

// CPU utilization indicator: one column per cpu line of /proc/stat, filled from the bottom.
class Cpu : public AApp {
 public:
  static constexpr const char* NAME = "dockapp-cpu";

  struct Options {
    util::Rect window{0, 0, 100, 20};
    std::chrono::milliseconds interval{std::chrono::seconds(1)};
    std::vector<std::string> ignore;
    std::string stat_path{"/proc/stat"};
    util::Color background{0xff, 0xff, 0xff};
    util::Color bar{0x00, 0x00, 0x00};

    static Options fromConfig(const Json::Value& config);
  };

  static clara::detail::Parser cli(CommandLine& cmdline);
  static std::unique_ptr<AApp> create(Display* display, const Json::Value& config);

  Cpu(const Options& options, std::shared_ptr<cpu::DeltaSource> source,
      std::unique_ptr<DockApp> window);
  ~Cpu() override;

  auto start() -> void override;
  auto stop() -> void override;
  // Starts a fresh baseline, so the next bars do not average over a suspend.
  auto refresh() -> void override;
  auto update() -> void override;

  // Drops every cpu named in `ignore`, keeping the order of the rest.
  static cpu::CpuTimes visible(const cpu::CpuTimes& times, const std::vector<std::string>& ignore);
  static void draw(ICanvas& canvas, const Options& options, const cpu::CpuTimes& times);

 private:
  const Options options_;
  std::vector<std::string> cpus_;
  const std::shared_ptr<cpu::DeltaSource> deltas_;

  util::RefreshCoordinator<cpu::CpuTimes> poller_;
};

}  // namespace dockapp::modules
