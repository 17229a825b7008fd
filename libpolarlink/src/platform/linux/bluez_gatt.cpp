/**
 * @file bluez_gatt.cpp
 * @brief BlueZ GATT client implementation
 *
 * Implements BLE scanning, connection and GATT access using BlueZ via
 * D-Bus.
 */

#include "bluez_gatt.h"
#include "polarlink/log.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>

namespace polarlink {
namespace platform {

namespace {

constexpr const char *LOG_MODULE = "bluez";

/// How often blocking waits re-check their condition
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

/// Properties.Get/Set and GATT calls
constexpr int CALL_TIMEOUT_MS = 5000;

bool error_mentions(const Error &err, const char *needle) {
  return err.message.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// BlueZ Adapter Discovery
// ============================================================================

Result<BlueZAdapter> find_adapter(DBusConnection *conn) {
  auto objects = get_managed_objects(conn, BLUEZ_SERVICE);
  if (objects.is_error()) {
    return objects.error();
  }

  // std::map keeps paths sorted, so hci0 comes before hci1
  for (const auto &object : objects.value()) {
    auto iface = object.second.find(BLUEZ_ADAPTER_IFACE);
    if (iface == object.second.end()) {
      continue;
    }

    BlueZAdapter adapter;
    adapter.object_path = object.first;

    const PropertyMap &props = iface->second;
    auto it = props.find("Address");
    if (it != props.end()) {
      adapter.address = it->second.string_value;
    }
    it = props.find("Name");
    if (it != props.end()) {
      adapter.name = it->second.string_value;
    }
    it = props.find("Powered");
    if (it != props.end()) {
      adapter.powered = it->second.bool_value;
    }

    return adapter;
  }

  return Error(ErrorCode::BluetoothNotSupported,
               "No Bluetooth adapter found");
}

// ============================================================================
// Adapter Control
// ============================================================================

Result<void> set_adapter_powered(DBusConnection *conn,
                                 const std::string &adapter_path,
                                 bool powered) {
  dbus_bool_t value = powered ? TRUE : FALSE;
  return set_property(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                      BLUEZ_ADAPTER_IFACE, "Powered", DBUS_TYPE_BOOLEAN,
                      &value);
}

Result<void> set_le_discovery_filter(DBusConnection *conn,
                                     const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "SetDiscoveryFilter",
                            [](DBusMessageIter *iter) {
                              append_string_dict(iter, {{"Transport", "le"}});
                            });

  if (result.is_error()) {
    return result.error();
  }

  return Result<void>::ok();
}

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StartDiscovery");

  if (result.is_error()) {
    // Already discovering is not an error
    if (error_mentions(result.error(), "Already") ||
        error_mentions(result.error(), "InProgress")) {
      return Result<void>::ok();
    }
    Error err(ErrorCode::BleScanFailed, "Failed to start BLE scan",
              result.error().message);
    if (error_mentions(result.error(), "NotReady")) {
      err.code = ErrorCode::BluetoothOff;
    }
    return err;
  }

  return Result<void>::ok();
}

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StopDiscovery");

  if (result.is_error()) {
    // Not discovering is not an error
    if (error_mentions(result.error(), "Not")) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

std::string device_object_path(const std::string &adapter_path,
                               const std::string &address) {
  std::string path = adapter_path + "/dev_";
  for (char c : address) {
    path += (c == ':') ? '_'
                       : static_cast<char>(
                             std::toupper(static_cast<unsigned char>(c)));
  }
  return path;
}

// ============================================================================
// BlueZTransport
// ============================================================================

BlueZTransport::BlueZTransport() {
  // The signal thread and callers share libdbus state
  dbus_threads_init_default();
}

BlueZTransport::~BlueZTransport() {
  if (connected_.load()) {
    auto result = disconnect();
    if (result.is_error()) {
      POLARLINK_LOG_WARN(LOG_MODULE, "Disconnect during shutdown failed: "
                                         << result.error().message);
    }
  }
  stop_signal_thread();
}

Result<void> BlueZTransport::ensure_adapter() {
  if (!conn_) {
    auto bus = get_system_bus();
    if (bus.is_error()) {
      return Error(ErrorCode::ServiceUnavailable,
                   "Cannot connect to the system D-Bus",
                   bus.error().message);
    }
    conn_ = std::move(bus.value());
  }

  if (adapter_ready_) {
    return Result<void>::ok();
  }

  auto adapter = find_adapter(conn_.get());
  if (adapter.is_error()) {
    return adapter.error();
  }
  adapter_ = adapter.value();

  if (!adapter_.powered) {
    POLARLINK_LOG_INFO(LOG_MODULE,
                       "Powering on adapter " << adapter_.object_path);
    auto power = set_adapter_powered(conn_.get(), adapter_.object_path, true);
    if (power.is_error()) {
      return Error(ErrorCode::BluetoothOff, "Bluetooth adapter is off",
                   power.error().message);
    }
    adapter_.powered = true;
  }

  adapter_ready_ = true;
  POLARLINK_LOG_DEBUG(LOG_MODULE, "Using adapter " << adapter_.object_path
                                                   << " (" << adapter_.address
                                                   << ")");
  return Result<void>::ok();
}

Result<std::vector<BleDeviceInfo>>
BlueZTransport::scan(std::chrono::milliseconds timeout) {
  POLARLINK_TRY(ensure_adapter());

  auto filter = set_le_discovery_filter(conn_.get(), adapter_.object_path);
  if (filter.is_error()) {
    POLARLINK_LOG_DEBUG(LOG_MODULE, "LE discovery filter rejected: "
                                        << filter.error().message);
  }

  POLARLINK_TRY(start_discovery(conn_.get(), adapter_.object_path));
  POLARLINK_LOG_DEBUG(LOG_MODULE, "Scanning for " << timeout.count() << " ms");

  std::this_thread::sleep_for(timeout);

  auto objects = get_managed_objects(conn_.get(), BLUEZ_SERVICE);

  auto stop = stop_discovery(conn_.get(), adapter_.object_path);
  if (stop.is_error()) {
    POLARLINK_LOG_WARN(LOG_MODULE,
                       "Failed to stop discovery: " << stop.error().message);
  }

  if (objects.is_error()) {
    return Error(ErrorCode::BleScanFailed, "Failed to read scan results",
                 objects.error().message);
  }

  const std::string prefix = adapter_.object_path + "/";
  std::vector<BleDeviceInfo> devices;

  for (const auto &object : objects.value()) {
    if (object.first.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    auto iface = object.second.find(BLUEZ_DEVICE_IFACE);
    if (iface == object.second.end()) {
      continue;
    }

    const PropertyMap &props = iface->second;

    // Devices only remembered from earlier sessions carry no RSSI
    auto rssi = props.find("RSSI");
    if (rssi == props.end()) {
      continue;
    }

    BleDeviceInfo info;
    info.rssi_dbm = static_cast<int>(rssi->second.int_value);

    auto it = props.find("Address");
    if (it != props.end()) {
      info.address = it->second.string_value;
    }
    it = props.find("Name");
    if (it == props.end()) {
      it = props.find("Alias");
    }
    if (it != props.end()) {
      info.name = it->second.string_value;
    }
    it = props.find("UUIDs");
    if (it != props.end()) {
      for (const auto &uuid : it->second.string_array) {
        info.service_uuids.push_back(normalize_uuid(uuid));
      }
    }

    devices.push_back(std::move(info));
  }

  // Strongest signal first
  std::sort(devices.begin(), devices.end(),
            [](const BleDeviceInfo &a, const BleDeviceInfo &b) {
              return a.rssi_dbm > b.rssi_dbm;
            });

  POLARLINK_LOG_DEBUG(LOG_MODULE, "Scan found " << devices.size()
                                                << " device(s)");
  return devices;
}

Result<void> BlueZTransport::connect(const std::string &address,
                                     std::chrono::milliseconds timeout) {
  if (connected_.load()) {
    return Error(ErrorCode::AlreadyConnected, "Transport already connected");
  }
  POLARLINK_REQUIRE(is_valid_ble_address(address),
                    ErrorCode::InvalidArgument,
                    "Invalid Bluetooth address: " + address);

  POLARLINK_TRY(ensure_adapter());

  const std::string path = device_object_path(adapter_.object_path, address);
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  // BlueZ only knows devices it has seen; scan briefly if needed
  auto known = get_string_property(conn_.get(), BLUEZ_SERVICE, path.c_str(),
                                   BLUEZ_DEVICE_IFACE, "Address");
  if (known.is_error()) {
    POLARLINK_LOG_DEBUG(LOG_MODULE,
                        "Device " << address << " unknown, scanning first");
    auto found = scan(std::min(timeout / 2, std::chrono::milliseconds(5000)));
    if (found.is_error()) {
      return found.error();
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    device_path_ = path;
    services_.clear();
    char_paths_.clear();
    handlers_.clear();
  }

  // Start listening before Connect so no PropertiesChanged is missed
  POLARLINK_TRY(start_signal_thread());

  POLARLINK_LOG_INFO(LOG_MODULE, "Connecting to " << address);
  auto reply =
      call_method(conn_.get(), BLUEZ_SERVICE, path.c_str(),
                  BLUEZ_DEVICE_IFACE, "Connect", nullptr,
                  static_cast<int>(timeout.count()));
  if (reply.is_error()) {
    stop_signal_thread();
    Error err(ErrorCode::ConnectionFailed, "Failed to connect to " + address,
              reply.error().message);
    if (error_mentions(reply.error(), "NoReply") ||
        error_mentions(reply.error(), "Timeout")) {
      err.code = ErrorCode::ConnectionTimeout;
    }
    return err;
  }

  // Wait for GATT discovery to finish
  bool resolved = false;
  while (std::chrono::steady_clock::now() < deadline) {
    auto flag = get_bool_property(conn_.get(), BLUEZ_SERVICE, path.c_str(),
                                  BLUEZ_DEVICE_IFACE, "ServicesResolved");
    if (flag.is_ok() && flag.value()) {
      resolved = true;
      break;
    }
    std::this_thread::sleep_for(POLL_INTERVAL);
  }

  if (!resolved) {
    auto drop = call_method(conn_.get(), BLUEZ_SERVICE, path.c_str(),
                            BLUEZ_DEVICE_IFACE, "Disconnect");
    if (drop.is_error()) {
      POLARLINK_LOG_DEBUG(LOG_MODULE, "Disconnect after timeout failed: "
                                          << drop.error().message);
    }
    stop_signal_thread();
    return Error(ErrorCode::ConnectionTimeout,
                 "Timed out resolving GATT services of " + address);
  }

  auto gatt = resolve_gatt_objects();
  if (gatt.is_error()) {
    stop_signal_thread();
    return gatt.error();
  }

  connected_ = true;
  POLARLINK_LOG_INFO(LOG_MODULE, "Connected to " << address);
  return Result<void>::ok();
}

Result<void> BlueZTransport::resolve_gatt_objects() {
  auto objects = get_managed_objects(conn_.get(), BLUEZ_SERVICE);
  if (objects.is_error()) {
    return objects.error();
  }

  std::string device_path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    device_path = device_path_;
  }
  const std::string prefix = device_path + "/";

  std::map<std::string, GattServiceInfo> by_path;
  std::map<std::string, std::string> char_paths;

  for (const auto &object : objects.value()) {
    if (object.first.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }

    auto service = object.second.find(BLUEZ_GATT_SERVICE_IFACE);
    if (service != object.second.end()) {
      auto uuid = service->second.find("UUID");
      if (uuid != service->second.end()) {
        by_path[object.first].uuid = normalize_uuid(uuid->second.string_value);
      }
    }

    auto chr = object.second.find(BLUEZ_GATT_CHAR_IFACE);
    if (chr != object.second.end()) {
      auto uuid = chr->second.find("UUID");
      auto owner = chr->second.find("Service");
      if (uuid == chr->second.end()) {
        continue;
      }
      const std::string char_uuid = normalize_uuid(uuid->second.string_value);
      char_paths[char_uuid] = object.first;
      if (owner != chr->second.end()) {
        by_path[owner->second.string_value].characteristic_uuids.push_back(
            char_uuid);
      }
    }
  }

  std::vector<GattServiceInfo> services;
  for (auto &entry : by_path) {
    if (!entry.second.uuid.empty()) {
      services.push_back(std::move(entry.second));
    }
  }

  POLARLINK_LOG_DEBUG(LOG_MODULE, "Resolved " << services.size()
                                              << " service(s), "
                                              << char_paths.size()
                                              << " characteristic(s)");

  std::lock_guard<std::mutex> lock(mutex_);
  services_ = std::move(services);
  char_paths_ = std::move(char_paths);
  return Result<void>::ok();
}

Result<void> BlueZTransport::disconnect() {
  // Local disconnects must not look like link loss
  stop_signal_thread();

  std::string path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    path = device_path_;
    handlers_.clear();
  }

  const bool was_connected = connected_.exchange(false);
  if (!was_connected || path.empty() || !conn_) {
    return Result<void>::ok();
  }

  auto reply = call_method(conn_.get(), BLUEZ_SERVICE, path.c_str(),
                           BLUEZ_DEVICE_IFACE, "Disconnect", nullptr,
                           CALL_TIMEOUT_MS);
  if (reply.is_error()) {
    return Error(ErrorCode::PlatformError, "Disconnect failed",
                 reply.error().message);
  }

  POLARLINK_LOG_INFO(LOG_MODULE, "Disconnected");
  return Result<void>::ok();
}

bool BlueZTransport::is_connected() const { return connected_.load(); }

std::vector<GattServiceInfo> BlueZTransport::services() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return services_;
}

Result<std::string>
BlueZTransport::characteristic_path(const std::string &char_uuid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = char_paths_.find(normalize_uuid(char_uuid));
  if (it == char_paths_.end()) {
    return Error(ErrorCode::CharacteristicNotFound,
                 "Characteristic not found: " + char_uuid);
  }
  return it->second;
}

Result<void> BlueZTransport::write(const std::string &char_uuid,
                                   const Bytes &data) {
  if (!connected_.load()) {
    return Error(ErrorCode::NotConnected, "Not connected");
  }

  auto path = characteristic_path(char_uuid);
  if (path.is_error()) {
    return path.error();
  }

  auto reply = call_method(
      conn_.get(), BLUEZ_SERVICE, path.value().c_str(), BLUEZ_GATT_CHAR_IFACE,
      "WriteValue",
      [&data](DBusMessageIter *iter) {
        DBusMessageIter array_iter;
        const uint8_t *bytes = data.data();
        dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "y",
                                         &array_iter);
        dbus_message_iter_append_fixed_array(&array_iter, DBUS_TYPE_BYTE,
                                             &bytes,
                                             static_cast<int>(data.size()));
        dbus_message_iter_close_container(iter, &array_iter);
        append_string_dict(iter, {{"type", "request"}});
      },
      CALL_TIMEOUT_MS);

  if (reply.is_error()) {
    return Error(ErrorCode::GattWriteFailed, "Write to " + char_uuid + " failed",
                 reply.error().message);
  }

  return Result<void>::ok();
}

Result<void> BlueZTransport::start_notify(const std::string &char_uuid,
                                          NotificationHandler handler) {
  if (!connected_.load()) {
    return Error(ErrorCode::NotConnected, "Not connected");
  }

  auto path = characteristic_path(char_uuid);
  if (path.is_error()) {
    return path.error();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[path.value()] = std::move(handler);
  }

  auto reply = call_method(conn_.get(), BLUEZ_SERVICE, path.value().c_str(),
                           BLUEZ_GATT_CHAR_IFACE, "StartNotify", nullptr,
                           CALL_TIMEOUT_MS);
  if (reply.is_error() && !error_mentions(reply.error(), "InProgress")) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(path.value());
    return Error(ErrorCode::NotifyFailed,
                 "Failed to enable notifications on " + char_uuid,
                 reply.error().message);
  }

  POLARLINK_LOG_DEBUG(LOG_MODULE, "Notifications enabled on " << char_uuid);
  return Result<void>::ok();
}

Result<void> BlueZTransport::stop_notify(const std::string &char_uuid) {
  auto path = characteristic_path(char_uuid);
  if (path.is_error()) {
    return path.error();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(path.value());
  }

  if (!connected_.load()) {
    return Result<void>::ok();
  }

  auto reply = call_method(conn_.get(), BLUEZ_SERVICE, path.value().c_str(),
                           BLUEZ_GATT_CHAR_IFACE, "StopNotify", nullptr,
                           CALL_TIMEOUT_MS);
  if (reply.is_error()) {
    return Error(ErrorCode::NotifyFailed,
                 "Failed to disable notifications on " + char_uuid,
                 reply.error().message);
  }

  return Result<void>::ok();
}

void BlueZTransport::on_disconnected(DisconnectHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect_handler_ = std::move(handler);
}

// ============================================================================
// Signal Thread
// ============================================================================

Result<void> BlueZTransport::start_signal_thread() {
  if (signal_thread_.joinable()) {
    if (!stop_requested_.load()) {
      return Result<void>::ok();
    }
    signal_thread_.join();
    signal_conn_.reset();
  }

  auto bus = get_private_system_bus();
  if (bus.is_error()) {
    return bus.error();
  }
  signal_conn_ = std::move(bus.value());

  DBusErrorWrapper error;
  dbus_bus_add_match(signal_conn_.get(),
                     "type='signal',sender='org.bluez',"
                     "interface='org.freedesktop.DBus.Properties',"
                     "member='PropertiesChanged'",
                     error.get());
  if (error.is_set()) {
    Error err = error.to_error();
    signal_conn_.reset();
    return err;
  }

  stop_requested_ = false;
  signal_thread_ = std::thread(&BlueZTransport::signal_loop, this);
  return Result<void>::ok();
}

void BlueZTransport::stop_signal_thread() {
  stop_requested_ = true;
  if (signal_thread_.joinable()) {
    if (signal_thread_.get_id() == std::this_thread::get_id()) {
      // Called from a handler: the loop exits after it returns and a
      // later call from another thread joins it
      return;
    }
    signal_thread_.join();
  }
  signal_conn_.reset();
}

void BlueZTransport::signal_loop() {
  DBusConnection *conn = signal_conn_.get();

  while (!stop_requested_.load()) {
    if (!dbus_connection_read_write(
            conn, static_cast<int>(POLL_INTERVAL.count()))) {
      POLARLINK_LOG_ERROR(LOG_MODULE, "Signal connection closed");
      break;
    }

    DBusMessage *raw = nullptr;
    while (!stop_requested_.load() &&
           (raw = dbus_connection_pop_message(conn)) != nullptr) {
      DBusMessageWrapper msg(raw);
      if (dbus_message_is_signal(msg.get(), DBUS_PROPERTIES_IFACE,
                                 "PropertiesChanged")) {
        handle_properties_changed(msg.get());
      }
    }
  }
}

void BlueZTransport::handle_properties_changed(DBusMessage *msg) {
  const char *path = dbus_message_get_path(msg);
  if (!path) {
    return;
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) {
    return;
  }

  const char *iface = nullptr;
  dbus_message_iter_get_basic(&iter, &iface);
  dbus_message_iter_next(&iter);
  if (!iface) {
    return;
  }

  PropertyMap changed = read_property_dict(&iter);

  if (std::strcmp(iface, BLUEZ_GATT_CHAR_IFACE) == 0) {
    auto value = changed.find("Value");
    if (value == changed.end()) {
      return;
    }

    NotificationHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(path);
      if (it != handlers_.end()) {
        handler = it->second;
      }
    }
    if (handler) {
      handler(value->second.byte_array);
    }
    return;
  }

  if (std::strcmp(iface, BLUEZ_DEVICE_IFACE) == 0) {
    auto connected = changed.find("Connected");
    if (connected == changed.end() || connected->second.bool_value) {
      return;
    }

    DisconnectHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (device_path_ != path) {
        return;
      }
      handler = disconnect_handler_;
    }

    if (connected_.exchange(false)) {
      POLARLINK_LOG_WARN(LOG_MODULE, "Device " << path << " disconnected");
      if (handler) {
        handler();
      }
    }
  }
}

} // namespace platform
} // namespace polarlink
