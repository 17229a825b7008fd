/**
 * @file bluez_gatt.h
 * @brief BlueZ GATT client transport
 *
 * Implements GattTransport on top of BlueZ's D-Bus API (Adapter1,
 * Device1, GattService1, GattCharacteristic1).
 */

#ifndef POLARLINK_PLATFORM_LINUX_BLUEZ_GATT_H
#define POLARLINK_PLATFORM_LINUX_BLUEZ_GATT_H

#include "dbus_helpers.h"
#include "polarlink/transport.h"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace polarlink {
namespace platform {

// BlueZ D-Bus constants
constexpr const char *BLUEZ_SERVICE = "org.bluez";
constexpr const char *BLUEZ_ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char *BLUEZ_DEVICE_IFACE = "org.bluez.Device1";
constexpr const char *BLUEZ_GATT_SERVICE_IFACE = "org.bluez.GattService1";
constexpr const char *BLUEZ_GATT_CHAR_IFACE = "org.bluez.GattCharacteristic1";
constexpr const char *DBUS_PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";

/**
 * @brief BlueZ adapter state
 */
struct BlueZAdapter {
  std::string object_path; // e.g., "/org/bluez/hci0"
  std::string address;
  std::string name;
  bool powered = false;
};

/**
 * @brief Find the first available BlueZ adapter
 */
Result<BlueZAdapter> find_adapter(DBusConnection *conn);

Result<void> set_adapter_powered(DBusConnection *conn,
                                 const std::string &adapter_path, bool powered);

/**
 * @brief Restrict discovery to LE devices
 */
Result<void> set_le_discovery_filter(DBusConnection *conn,
                                     const std::string &adapter_path);

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path);

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path);

/// "/org/bluez/hci0" + "AA:BB:.." -> "/org/bluez/hci0/dev_AA_BB_.."
std::string device_object_path(const std::string &adapter_path,
                               const std::string &address);

/**
 * @brief GattTransport backed by BlueZ
 *
 * Method calls go over the shared system bus. PropertiesChanged signals
 * are read on a private connection by a background thread, which calls
 * notification and disconnect handlers.
 */
class BlueZTransport : public GattTransport {
public:
  BlueZTransport();
  ~BlueZTransport() override;

  BlueZTransport(const BlueZTransport &) = delete;
  BlueZTransport &operator=(const BlueZTransport &) = delete;

  Result<std::vector<BleDeviceInfo>>
  scan(std::chrono::milliseconds timeout) override;

  Result<void> connect(const std::string &address,
                       std::chrono::milliseconds timeout) override;

  Result<void> disconnect() override;

  bool is_connected() const override;

  std::vector<GattServiceInfo> services() const override;

  Result<void> write(const std::string &char_uuid, const Bytes &data) override;

  Result<void> start_notify(const std::string &char_uuid,
                            NotificationHandler handler) override;

  Result<void> stop_notify(const std::string &char_uuid) override;

  void on_disconnected(DisconnectHandler handler) override;

private:
  Result<void> ensure_adapter();
  Result<void> resolve_gatt_objects();
  Result<std::string> characteristic_path(const std::string &char_uuid) const;

  Result<void> start_signal_thread();
  void stop_signal_thread();
  void signal_loop();
  void handle_properties_changed(DBusMessage *msg);

  DBusConnectionWrapper conn_;
  BlueZAdapter adapter_;
  bool adapter_ready_ = false;

  mutable std::mutex mutex_;
  std::string device_path_;
  std::vector<GattServiceInfo> services_;
  std::map<std::string, std::string> char_paths_;         // uuid -> path
  std::map<std::string, NotificationHandler> handlers_;   // path -> handler
  DisconnectHandler disconnect_handler_;

  std::atomic<bool> connected_{false};
  std::atomic<bool> stop_requested_{false};
  DBusConnectionWrapper signal_conn_;
  std::thread signal_thread_;
};

} // namespace platform
} // namespace polarlink

#endif // POLARLINK_PLATFORM_LINUX_BLUEZ_GATT_H
