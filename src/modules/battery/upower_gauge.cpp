#include "modules/battery/upower_gauge.hpp"

#include <fmt/format.h>
#include <giomm/dbuswatchname.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace dockapp::modules::battery {

namespace {

std::string takeError(GError* error) {
  std::string message = error != nullptr ? error->message : "unknown error";
  if (error != nullptr) {
    g_error_free(error);
  }
  return message;
}

// The proxies from up_client_get_devices2 are released with the array.
UpDevice* openDevice(const std::string& object_path) {
  UpDevice* device = up_device_new();
  GError* error = nullptr;
  if (up_device_set_object_path_sync(device, object_path.c_str(), nullptr, &error) == FALSE) {
    g_object_unref(device);
    throw std::runtime_error(fmt::format("battery: {}: {}", object_path, takeError(error)));
  }
  return device;
}

std::string findBattery(UpClient* client, const std::string& native_path) {
  GPtrArray* devices = up_client_get_devices2(client);
  if (devices == nullptr) {
    throw std::runtime_error("battery: no devices reported by UPower");
  }
  std::string found;
  for (guint i = 0; i < devices->len && found.empty(); ++i) {
    auto* device = static_cast<UpDevice*>(g_ptr_array_index(devices, i));
    if (device == nullptr || !G_IS_OBJECT(device)) {
      continue;
    }
    UpDeviceKind kind;
    gchar* path = nullptr;
    g_object_get(device, "kind", &kind, "native-path", &path, NULL);
    const std::string device_path = path != nullptr ? path : "";
    g_free(path);
    spdlog::debug("battery: UPower device {} kind {} native-path \"{}\"",
                  up_device_get_object_path(device), up_device_kind_to_string(kind), device_path);
    if (kind == UP_DEVICE_KIND_BATTERY && (native_path.empty() || native_path == device_path)) {
      found = up_device_get_object_path(device);
    }
  }
  g_ptr_array_unref(devices);
  if (found.empty()) {
    throw std::runtime_error(native_path.empty()
                                 ? std::string("battery: no battery found")
                                 : fmt::format("battery: no battery at \"{}\"", native_path));
  }
  return found;
}

}  // namespace

UPowerGauge::UPowerGauge(const std::string& native_path) {
  GError* error = nullptr;
  upClient_ = up_client_new_full(nullptr, &error);
  if (upClient_ == nullptr) {
    throw std::runtime_error("battery: UPower client connection error: " + takeError(error));
  }
  try {
    objectPath_ = findBattery(upClient_, native_path);
    watchDevice(openDevice(objectPath_));
  } catch (...) {
    g_object_unref(upClient_);
    throw;
  }
  spdlog::info("battery: using {}", objectPath_);

  watcherID_ = Gio::DBus::watch_name(Gio::DBus::BusType::BUS_TYPE_SYSTEM, "org.freedesktop.UPower",
                                     sigc::mem_fun(*this, &UPowerGauge::onAppear),
                                     sigc::mem_fun(*this, &UPowerGauge::onVanished));
}

UPowerGauge::~UPowerGauge() {
  unsubscribe();
  if (watcherID_ != 0u) {
    Gio::DBus::unwatch_name(watcherID_);
  }
  if (notifyID_ != 0u) {
    g_signal_handler_disconnect(watchDevice_, notifyID_);
  }
  g_object_unref(watchDevice_);
  g_object_unref(upClient_);
}

auto UPowerGauge::fetch() -> Metrics {
  // A private proxy per fetch: the watch device belongs to the main thread.
  UpDevice* device = openDevice(objectPath_);
  UpDeviceState state;
  gdouble percentage = 0;
  gint64 time_empty = 0;
  gint64 time_full = 0;
  g_object_get(device, "state", &state, "percentage", &percentage, "time-to-empty", &time_empty,
               "time-to-full", &time_full, NULL);
  g_object_unref(device);
  spdlog::debug("battery: state {} percentage {} time-to-empty {} time-to-full {}",
                up_device_state_to_string(state), percentage, time_empty, time_full);
  return fromDeviceProperties(state, percentage, time_empty, time_full);
}

auto UPowerGauge::subscribeStateChange(std::function<void()> on_change,
                                       std::function<void()> on_closed) -> Unsubscribe {
  std::lock_guard<std::mutex> lock(mutex_);
  onChange_ = std::move(on_change);
  onClosed_ = std::move(on_closed);
  return [this] { unsubscribe(); };
}

void UPowerGauge::unsubscribe() {
  std::lock_guard<std::mutex> lock(mutex_);
  onChange_ = nullptr;
  onClosed_ = nullptr;
}

void UPowerGauge::onAppear(const Glib::RefPtr<Gio::DBus::Connection>&, const Glib::ustring& name,
                           const Glib::ustring& owner) {
  spdlog::debug("battery: {} owned by {}", name.raw(), owner.raw());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      return;
    }
  }
  // The service restarted: watch a proxy bound to the new owner.
  UpDevice* device = nullptr;
  try {
    device = openDevice(objectPath_);
  } catch (const std::runtime_error& e) {
    spdlog::error("{}, state notifications stay off", e.what());
    return;
  }
  watchDevice(device);

  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = false;
  spdlog::info("battery: {} is back, state notifications restored", name.raw());
  if (onChange_) {
    onChange_();
  }
}

void UPowerGauge::watchDevice(UpDevice* device) {
  if (watchDevice_ != nullptr) {
    g_signal_handler_disconnect(watchDevice_, notifyID_);
    g_object_unref(watchDevice_);
  }
  watchDevice_ = device;
  notifyID_ = g_signal_connect(watchDevice_, "notify", G_CALLBACK(deviceNotify_cb), this);
}

void UPowerGauge::onVanished(const Glib::RefPtr<Gio::DBus::Connection>&,
                             const Glib::ustring& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  spdlog::warn("battery: {} vanished from the system bus", name.raw());
  if (onClosed_) {
    onClosed_();
  }
}

// Callbacks run with the lock held so that none runs after unsubscribe() returns.
void UPowerGauge::deviceNotify_cb(UpDevice* /*device*/, GParamSpec* /*pspec*/, gpointer data) {
  auto* self = static_cast<UPowerGauge*>(data);
  std::lock_guard<std::mutex> lock(self->mutex_);
  if (!self->closed_ && self->onChange_) {
    self->onChange_();
  }
}

}  // namespace dockapp::modules::battery
