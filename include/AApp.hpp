#pragma once

#include <glibmm/dispatcher.h>
#include <json/json.h>

#include <memory>
#include <string>
#include <vector>

#include "dockapp.hpp"
#include "util/mailbox.hpp"

namespace dockapp {

// Options collected from the command line, keyed like the configuration file.
struct CommandLine {
  Json::Value overrides{Json::objectValue};
  std::vector<std::string> args;
};

/**
 * Base of a dockapp: owns the window and redraws it from the main loop whenever one of its
 * background producers publishes a new value.
 */
class AApp {
 public:
  virtual ~AApp() = default;

  // Starts the background producers.
  virtual auto start() -> void = 0;
  virtual auto stop() -> void = 0;
  // Requests an immediate refresh of every source, e.g. after resuming from sleep.
  virtual auto refresh() -> void {}
  // Redraws from the latest published values. Runs on the main loop.
  virtual auto update() -> void = 0;

  DockApp& window() { return *window_; }
  const std::string& name() const { return name_; }

  /// Emitting on this dispatcher triggers a update() call
  Glib::Dispatcher dp;

 protected:
  AApp(const std::string& name, std::unique_ptr<DockApp> window);

  // Wakes the main loop on every value offered to `channel`.
  template <typename T>
  void watch(util::Mailbox<T>& channel) {
    channel.onOffer([this] { dp.emit(); });
  }

  const std::string name_;
  std::unique_ptr<DockApp> window_;
};

}  // namespace dockapp
