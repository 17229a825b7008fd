/**
 * @file transport.h
 * @brief Abstract BLE GATT transport
 *
 * The device layer talks to the radio only through this interface. The
 * Linux build provides a BlueZ implementation; tests substitute a
 * scripted fake.
 */

#ifndef POLARLINK_TRANSPORT_H
#define POLARLINK_TRANSPORT_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace polarlink {

/// A GATT service and the characteristics it exposes
struct GattServiceInfo {
  std::string uuid;
  std::vector<std::string> characteristic_uuids;
};

/// Receives the value of a characteristic notification
using NotificationHandler = std::function<void(const Bytes &value)>;

/// Called when the remote side drops the link
using DisconnectHandler = std::function<void()>;

/**
 * @brief BLE central operations needed by PolarLink
 *
 * Implementations may invoke handlers from an internal thread.
 * UUID arguments are compared case-insensitively.
 */
class POLARLINK_API GattTransport {
public:
  virtual ~GattTransport() = default;

  /**
   * @brief Scan for advertising devices
   * @param timeout How long to listen
   * @return Devices seen, possibly empty
   */
  virtual Result<std::vector<BleDeviceInfo>>
  scan(std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Connect and resolve GATT services
   */
  virtual Result<void> connect(const std::string &address,
                               std::chrono::milliseconds timeout) = 0;

  virtual Result<void> disconnect() = 0;

  virtual bool is_connected() const = 0;

  /// Services resolved on the connected device
  virtual std::vector<GattServiceInfo> services() const = 0;

  /// Write with response
  virtual Result<void> write(const std::string &char_uuid,
                             const Bytes &data) = 0;

  virtual Result<void> start_notify(const std::string &char_uuid,
                                    NotificationHandler handler) = 0;

  virtual Result<void> stop_notify(const std::string &char_uuid) = 0;

  /// Replaces any previously set handler
  virtual void on_disconnected(DisconnectHandler handler) = 0;

  /**
   * @brief Scan and return the first device matching a predicate
   * @return DeviceNotFound if nothing matched within the timeout
   */
  Result<BleDeviceInfo>
  find_device(const std::function<bool(const BleDeviceInfo &)> &filter,
              std::chrono::milliseconds timeout);

  /// True if a service with the given UUID was resolved
  bool has_service(const std::string &service_uuid) const;
};

/**
 * @brief Create the transport for this platform
 * @return NotSupported when built without a BLE backend
 */
POLARLINK_API Result<std::unique_ptr<GattTransport>>
create_default_transport();

} // namespace polarlink

#endif // POLARLINK_TRANSPORT_H
