#pragma once

#include <giomm/dbusconnection.h>
#include <glibmm/variant.h>
#include <sigc++/signal.h>

#include <functional>
#include <optional>

namespace dockapp::util {

/**
 * Follows logind's PrepareForSleep signal on the system bus.
 *
 * Without a system bus the watcher logs a warning and stays inert; the dockapps then simply wait
 * for their next timer after a resume.
 */
class SleepWatcher {
 public:
  SleepWatcher();
  ~SleepWatcher();

  SleepWatcher(const SleepWatcher&) = delete;
  SleepWatcher& operator=(const SleepWatcher&) = delete;

  // Emitted on the main context with true when entering sleep and false on resume.
  sigc::signal<void(bool)>& signal_prepare_for_sleep() { return signal_; }

  // Calls `on_resume` after every wake up.
  sigc::connection onResume(std::function<void()> on_resume);

  bool watching() const { return subscription_ != 0; }

  // Handles the parameters of one PrepareForSleep signal.
  void notify(const Glib::VariantContainerBase& parameters);

  // The signal's single boolean argument, nullopt for anything else.
  static std::optional<bool> parseSleeping(const Glib::VariantContainerBase& parameters);

 private:
  void onSignal(const Glib::RefPtr<Gio::DBus::Connection>& connection,
                const Glib::ustring& sender_name, const Glib::ustring& object_path,
                const Glib::ustring& interface_name, const Glib::ustring& signal_name,
                const Glib::VariantContainerBase& parameters);

  Glib::RefPtr<Gio::DBus::Connection> connection_;
  guint subscription_{0};
  sigc::signal<void(bool)> signal_;
};

}  // namespace dockapp::util
