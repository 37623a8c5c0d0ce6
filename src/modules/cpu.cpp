#include "modules/cpu.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "modules/cpu/layout.hpp"
#include "modules/cpu/stat_source.hpp"
#include "util/json_value.hpp"

namespace dockapp::modules {

auto Cpu::Options::fromConfig(const Json::Value& config) -> Options {
  Options options;
  options.window = util::geometryValue(config, "window-geometry", options.window);
  options.interval = util::intervalValue(config, "interval", options.interval);
  options.ignore = util::stringListValue(config, "ignore");
  options.stat_path = util::stringValue(config, "stat-path", options.stat_path);

  const auto& colors = config["colors"];
  if (!colors.isNull() && !colors.isObject()) {
    throw std::invalid_argument("config: \"colors\" must be an object");
  }
  options.background = util::colorValue(colors, "background", options.background);
  options.bar = util::colorValue(colors, "bar", options.bar);
  return options;
}

clara::detail::Parser Cpu::cli(CommandLine& cmdline) {
  auto& o = cmdline.overrides;
  return clara::detail::Opt([&o](const std::string& g) { o["window-geometry"] = g; },
                            "geometry")["--window-geometry"]("window geometry in pixels") |
         clara::detail::Opt([&o](double seconds) { o["interval"] = seconds; },
                            "seconds")["--interval"]("sampling interval") |
         clara::detail::Opt([&o](const std::string& cpus) { o["ignore"] = cpus; },
                            "cpus")["--ignore"]("comma separated list of cpus to ignore");
}

std::unique_ptr<AApp> Cpu::create(Display* display, const Json::Value& config) {
  const auto options = Options::fromConfig(config);
  auto source =
      std::make_shared<cpu::DeltaSource>(std::make_shared<cpu::StatSource>(options.stat_path));
  // No text is drawn; any font will do.
  auto window = std::make_unique<DockApp>(display, NAME, options.window, "monospace");
  return std::make_unique<Cpu>(options, std::move(source), std::move(window));
}

Cpu::Cpu(const Options& options, std::shared_ptr<cpu::DeltaSource> source,
         std::unique_ptr<DockApp> window)
    : AApp(NAME, std::move(window)),
      options_(options),
      deltas_(source),
      poller_(std::move(source), options.interval, "cpu") {
  watch(poller_.channel());
}

Cpu::~Cpu() { stop(); }

auto Cpu::start() -> void {
  spdlog::info("cpu: sampling every {}ms", options_.interval.count());
  poller_.start();
}

auto Cpu::stop() -> void { poller_.stop(); }

auto Cpu::refresh() -> void {
  deltas_->reset();
  poller_.trigger();
}

auto Cpu::update() -> void {
  auto times = poller_.channel().poll();
  if (!times) {
    return;
  }
  auto shown = visible(*times, options_.ignore);
  auto names = cpu::names(shown);
  if (names != cpus_) {
    spdlog::info("cpus: [{}]", fmt::join(names, ", "));
    cpus_ = std::move(names);
  }
  try {
    draw(*window_, options_, shown);
  } catch (const std::exception& e) {
    spdlog::error("cpu: {}", e.what());
    return;
  }
  window_->flush();
}

cpu::CpuTimes Cpu::visible(const cpu::CpuTimes& times, const std::vector<std::string>& ignore) {
  cpu::CpuTimes result;
  std::copy_if(times.begin(), times.end(), std::back_inserter(result), [&ignore](const auto& t) {
    return std::find(ignore.begin(), ignore.end(), t.name) == ignore.end();
  });
  return result;
}

void Cpu::draw(ICanvas& canvas, const Options& options, const cpu::CpuTimes& times) {
  const auto area = canvas.bounds();
  canvas.fill(area, options.background);
  for (std::size_t i = 0; i < times.size(); ++i) {
    const auto column = cpu::columnRect(area, i, times.size());
    canvas.fill(cpu::barRect(column, cpu::utilization(times[i])), options.bar);
  }
}

}  // namespace dockapp::modules
