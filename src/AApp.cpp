#include "AApp.hpp"

#include <spdlog/spdlog.h>

namespace dockapp {

AApp::AApp(const std::string& name, std::unique_ptr<DockApp> window)
    : name_(name), window_(std::move(window)) {
  dp.connect([this] { update(); });
  spdlog::debug("{}: created", name_);
}

}  // namespace dockapp
