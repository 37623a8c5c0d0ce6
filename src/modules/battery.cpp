#include "modules/battery.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

#include "modules/battery/upower_gauge.hpp"
#include "util/json_value.hpp"

namespace dockapp::modules {

auto Battery::Options::fromConfig(const Json::Value& config) -> Options {
  Options options;
  options.window = util::geometryValue(config, "window-geometry", options.window);
  options.battery = util::geometryValue(config, "battery-geometry", options.battery);
  options.text = util::geometryValue(config, "text-geometry", options.text);
  options.border = util::intValue(config, "border", options.border);
  if (options.border < 0) {
    throw std::invalid_argument("config: \"border\" must not be negative");
  }
  options.font = util::stringValue(config, "font", options.font);
  options.font_size = util::doubleValue(config, "font-size", options.font_size);
  if (options.font_size <= 0) {
    throw std::invalid_argument("config: \"font-size\" must be positive");
  }
  options.interval = util::intervalValue(config, "interval", options.interval);
  options.text_interval = util::intervalValue(config, "text-interval", options.text_interval);
  options.device = util::stringValue(config, "device", options.device);

  if (config["formats"].isString()) {
    options.formats.push_back(config["formats"].asString());
  } else if (config["formats"].isArray()) {
    for (const auto& format : config["formats"]) {
      if (!format.isString()) {
        throw std::invalid_argument("config: \"formats\" must be a list of strings");
      }
      options.formats.push_back(format.asString());
    }
  } else if (!config["formats"].isNull()) {
    throw std::invalid_argument("config: \"formats\" must be a list of strings");
  }

  const auto& colors = config["colors"];
  if (!colors.isNull() && !colors.isObject()) {
    throw std::invalid_argument("config: \"colors\" must be an object");
  }
  auto& palette = options.palette;
  palette.background = util::colorValue(colors, "background", palette.background);
  palette.shell = util::colorValue(colors, "shell", palette.shell);
  palette.text = util::colorValue(colors, "text", palette.text);
  palette.charging = util::colorValue(colors, "charging", palette.charging);
  palette.low = util::colorValue(colors, "low", palette.low);
  palette.normal = util::colorValue(colors, "normal", palette.normal);
  palette.low_threshold = util::doubleValue(config, "low-threshold", palette.low_threshold);
  return options;
}

std::string Battery::Options::fontPattern() const {
  return fmt::format("{}:size={}:dpi=72", font, font_size);
}

clara::detail::Parser Battery::cli(CommandLine& cmdline) {
  auto& o = cmdline.overrides;
  return clara::detail::Opt([&o](const std::string& g) { o["window-geometry"] = g; },
                            "geometry")["--window-geometry"]("window geometry in pixels") |
         clara::detail::Opt([&o](const std::string& g) { o["battery-geometry"] = g; },
                            "geometry")["--battery-geometry"]("battery icon geometry in pixels") |
         clara::detail::Opt([&o](const std::string& g) { o["text-geometry"] = g; },
                            "geometry")["--text-geometry"]("text box geometry in pixels") |
         clara::detail::Opt([&o](int border) { o["border"] = border; },
                            "pixels")["--border"]("battery border thickness in pixels") |
         clara::detail::Opt([&o](const std::string& font) { o["font"] = font; },
                            "pattern")["--font"]("text font, as an Xft font pattern") |
         clara::detail::Opt([&o](double size) { o["font-size"] = size; },
                            "points")["--font-size"]("text font size") |
         clara::detail::Opt([&o](double seconds) { o["interval"] = seconds; },
                            "seconds")["--interval"]("battery refresh interval") |
         clara::detail::Opt([&o](double seconds) { o["text-interval"] = seconds; },
                            "seconds")["--text-interval"]("time each format is displayed") |
         clara::detail::Opt([&o](const std::string& path) { o["device"] = path; },
                            "native-path")["--device"]("battery to display, default the first") |
         clara::detail::Arg(cmdline.args, "format")("formats to rotate through");
}

std::unique_ptr<AApp> Battery::create(Display* display, const Json::Value& config) {
  const auto options = Options::fromConfig(config);
  // Fail on a bad format before touching UPower or X.
  battery::makeFormatters(options.formats);
  auto gauge = std::make_shared<battery::UPowerGauge>(options.device);
  auto window = std::make_unique<DockApp>(display, NAME, options.window, options.fontPattern());
  return std::make_unique<Battery>(options, std::move(gauge), std::move(window));
}

Battery::Battery(const Options& options, std::shared_ptr<ISampleSource<battery::Metrics>> source,
                 std::unique_ptr<DockApp> window)
    : AApp(NAME, std::move(window)),
      options_(options),
      layout_(battery::computeLayout(options.battery, options.border)),
      profiler_(std::move(source), options.interval, "battery"),
      rotator_(battery::makeFormatters(options.formats), options.text_interval) {
  watch(profiler_.channel());
  watch(rotator_.channel());
}

Battery::~Battery() { stop(); }

auto Battery::start() -> void {
  spdlog::info("battery: refreshing every {}s, rotating {} formats every {}ms",
               std::chrono::duration_cast<std::chrono::seconds>(options_.interval).count(),
               rotator_.size(), options_.text_interval.count());
  profiler_.start();
  rotator_.start();
}

auto Battery::stop() -> void {
  rotator_.stop();
  profiler_.stop();
}

auto Battery::refresh() -> void { profiler_.trigger(); }

auto Battery::update() -> void {
  bool changed = false;
  if (auto metrics = profiler_.channel().poll()) {
    metrics_ = std::move(metrics);
    changed = true;
  }
  if (auto formatter = rotator_.channel().poll()) {
    formatter_ = std::move(*formatter);
    changed = true;
  }
  if (!changed) {
    return;
  }
  if (!metrics_) {
    spdlog::debug("battery: no metrics yet");
    return;
  }
  if (!formatter_) {
    spdlog::debug("battery: no format yet");
    return;
  }
  try {
    draw(*window_, options_, layout_, *metrics_, *formatter_);
  } catch (const std::exception& e) {
    spdlog::error("battery: {}", e.what());
    return;
  }
  window_->flush();
}

void Battery::draw(ICanvas& canvas, const Options& options, const battery::BatteryLayout& layout,
                   const battery::Metrics& metrics, const battery::MetricFormatter& formatter) {
  const auto text = formatter.format(metrics);
  const auto& palette = options.palette;

  canvas.fill(canvas.bounds(), palette.background);
  const auto& energy = battery::energyColor(metrics, palette);
  for (const auto& rect : battery::energyRects(layout, metrics.fraction)) {
    canvas.fill(rect, energy);
  }
  for (const auto& rect : layout.shell) {
    canvas.fill(rect, palette.shell);
  }
  canvas.drawText(options.text, text, palette.text);
}

}  // namespace dockapp::modules
