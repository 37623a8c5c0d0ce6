#pragma once

#include <clara.hpp>
#include <glibmm/main.h>

#include <functional>
#include <memory>
#include <string>

#include "AApp.hpp"
#include "config.hpp"
#include "util/sleep_watcher.hpp"

namespace dockapp {

// What a dockapp executable plugs into the shared client.
struct AppInfo {
  std::string name;
  // Configuration files are looked up as <config_name>.json and <config_name>.jsonc.
  std::string config_name;
  std::function<clara::detail::Parser(CommandLine&)> cli;
  std::function<std::unique_ptr<AApp>(Display*, const Json::Value&)> create;
  // Configuration key receiving positional command line arguments, if any.
  std::string args_key;
};

class Client {
 public:
  static Client *inst();
  int main(int argc, char *argv[], const AppInfo &info);
  void reset();

  Config config;

 private:
  Client() = default;
  bool handleSignal(Glib::IOCondition condition);
  bool handleXEvents(Glib::IOCondition condition);

  Glib::RefPtr<Glib::MainLoop> main_loop_;
  std::unique_ptr<AApp> app_;
  std::unique_ptr<util::SleepWatcher> sleep_watcher_;
};

// Runs a dockapp executable: sets up logging, then Client::main, reporting fatal errors.
int run(int argc, char *argv[], const AppInfo &info);

}  // namespace dockapp
