#include "util/sleep_watcher.hpp"

#include <glibmm/error.h>
#include <spdlog/spdlog.h>

#include <string>

namespace dockapp::util {

SleepWatcher::SleepWatcher() {
  try {
    connection_ = Gio::DBus::Connection::get_sync(Gio::DBus::BUS_TYPE_SYSTEM);
  } catch (const Glib::Error& e) {
    spdlog::warn("Unable to connect to the system bus, not watching for resume: {}",
                 static_cast<std::string>(e.what()));
    return;
  }
  subscription_ = connection_->signal_subscribe(
      sigc::mem_fun(*this, &SleepWatcher::onSignal), "org.freedesktop.login1",
      "org.freedesktop.login1.Manager", "PrepareForSleep", "/org/freedesktop/login1");
  spdlog::debug("watching org.freedesktop.login1 for PrepareForSleep");
}

SleepWatcher::~SleepWatcher() {
  if (connection_ && subscription_ != 0) {
    connection_->signal_unsubscribe(subscription_);
  }
}

sigc::connection SleepWatcher::onResume(std::function<void()> on_resume) {
  return signal_.connect([on_resume](bool sleeping) {
    if (!sleeping) {
      on_resume();
    }
  });
}

std::optional<bool> SleepWatcher::parseSleeping(const Glib::VariantContainerBase& parameters) {
  if (!parameters.gobj() || parameters.get_type_string() != "(b)") {
    return std::nullopt;
  }
  Glib::Variant<bool> sleeping;
  parameters.get_child(sleeping, 0);
  return sleeping.get();
}

void SleepWatcher::notify(const Glib::VariantContainerBase& parameters) {
  auto sleeping = parseSleeping(parameters);
  if (!sleeping) {
    spdlog::warn("PrepareForSleep with unexpected arguments, ignored");
    return;
  }
  spdlog::debug("PrepareForSleep({})", *sleeping);
  signal_.emit(*sleeping);
}

void SleepWatcher::onSignal(const Glib::RefPtr<Gio::DBus::Connection>& /*connection*/,
                            const Glib::ustring& /*sender_name*/,
                            const Glib::ustring& /*object_path*/,
                            const Glib::ustring& /*interface_name*/,
                            const Glib::ustring& /*signal_name*/,
                            const Glib::VariantContainerBase& parameters) {
  notify(parameters);
}

}  // namespace dockapp::util
