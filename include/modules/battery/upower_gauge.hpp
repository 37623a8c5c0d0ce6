#pragma once

#include <giomm/dbusconnection.h>
#include <libupower-glib/upower.h>

#include <functional>
#include <mutex>
#include <string>

#include "interfaces/ISampleSource.hpp"
#include "modules/battery/metrics.hpp"

namespace dockapp::modules::battery {

/**
 * Battery metrics read from UPower.
 *
 * The device is picked once, at construction: the first battery, or the battery whose
 * native-path matches `native_path` when one is given. Construction throws std::runtime_error
 * when UPower is unreachable or there is no such battery.
 *
 * Must be constructed on the thread running the Glib main loop; change notifications are
 * delivered there. fetch() may be called from any thread. Notifications close while the UPower
 * service is gone from the system bus and resume, with an immediate change, once it is back.
 */
class UPowerGauge : public ISampleSource<Metrics>, public IStateNotifier {
 public:
  explicit UPowerGauge(const std::string& native_path = "");
  ~UPowerGauge() override;

  UPowerGauge(const UPowerGauge&) = delete;
  UPowerGauge& operator=(const UPowerGauge&) = delete;

  auto fetch() -> Metrics override;
  auto subscribeStateChange(std::function<void()> on_change, std::function<void()> on_closed)
      -> Unsubscribe override;

  const std::string& objectPath() const { return objectPath_; }

 private:
  void onAppear(const Glib::RefPtr<Gio::DBus::Connection>&, const Glib::ustring&,
                const Glib::ustring&);
  void onVanished(const Glib::RefPtr<Gio::DBus::Connection>&, const Glib::ustring&);
  void unsubscribe();
  // Takes ownership of `device` and follows its property changes instead of the current one.
  void watchDevice(UpDevice* device);

  static void deviceNotify_cb(UpDevice* device, GParamSpec* pspec, gpointer data);

  std::mutex mutex_;
  std::function<void()> onChange_;
  std::function<void()> onClosed_;
  bool closed_{false};

  UpClient* upClient_{nullptr};
  UpDevice* watchDevice_{nullptr};
  gulong notifyID_{0};
  guint watcherID_{0};
  std::string objectPath_;
};

}  // namespace dockapp::modules::battery
