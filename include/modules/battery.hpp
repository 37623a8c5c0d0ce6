#pragma once

#include <clara.hpp>
#include <json/json.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "AApp.hpp"
#include "modules/battery/layout.hpp"
#include "modules/battery/metrics.hpp"
#include "util/format_rotator.hpp"
#include "util/refresh_coordinator.hpp"

namespace dockapp::modules {

/**
 * Battery indicator: a battery glyph filled to the current charge next to a line of text that
 * rotates through the configured formats.
 */
class Battery : public AApp {
 public:
  static constexpr const char* NAME = "dockapp-battery";

  struct Options {
    util::Rect window{0, 0, 117, 20};
    util::Rect battery{1, 2, 21, 18};
    util::Rect text{22, 0, 95, 20};
    int border{1};
    std::string font{"DejaVu Sans:bold"};
    double font_size{14};
    std::chrono::milliseconds interval{std::chrono::minutes(1)};
    std::chrono::milliseconds text_interval{7500};
    std::vector<std::string> formats;
    std::string device;
    battery::Palette palette;

    static Options fromConfig(const Json::Value& config);
    // Xft pattern for `font` at `font_size` points, 72 dpi.
    std::string fontPattern() const;
  };

  static clara::detail::Parser cli(CommandLine& cmdline);
  static std::unique_ptr<AApp> create(Display* display, const Json::Value& config);

  Battery(const Options& options, std::shared_ptr<ISampleSource<battery::Metrics>> source,
          std::unique_ptr<DockApp> window);
  ~Battery() override;

  auto start() -> void override;
  auto stop() -> void override;
  auto refresh() -> void override;
  auto update() -> void override;

  /**
   * Draws one frame: background, energy, shell, then the formatted text. The text is formatted
   * before anything is drawn so that a failing formatter leaves the canvas untouched.
   */
  static void draw(ICanvas& canvas, const Options& options, const battery::BatteryLayout& layout,
                   const battery::Metrics& metrics, const battery::MetricFormatter& formatter);

 private:
  const Options options_;
  const battery::BatteryLayout layout_;

  std::optional<battery::Metrics> metrics_;
  battery::FormatterPtr formatter_;

  util::RefreshCoordinator<battery::Metrics> profiler_;
  util::FormatRotator<battery::FormatterPtr> rotator_;
};

}  // namespace dockapp::modules
