/**
 * @file transport.cpp
 * @brief Shared GattTransport helpers and backend selection
 */

#include "polarlink/transport.h"
#include "polarlink/log.h"

#if defined(POLARLINK_BLUETOOTH_BLUEZ)
#include "platform/linux/bluez_gatt.h"
#endif

namespace polarlink {

Result<BleDeviceInfo> GattTransport::find_device(
    const std::function<bool(const BleDeviceInfo &)> &filter,
    std::chrono::milliseconds timeout) {
  auto devices = scan(timeout);
  if (devices.is_error()) {
    return devices.error();
  }

  for (const auto &device : devices.value()) {
    if (filter(device)) {
      POLARLINK_LOG_DEBUG("transport", "Matched device " << device.name
                                                         << " ("
                                                         << device.address
                                                         << ")");
      return device;
    }
  }

  return Error(ErrorCode::DeviceNotFound, "No matching device found");
}

bool GattTransport::has_service(const std::string &service_uuid) const {
  const std::string wanted = normalize_uuid(service_uuid);
  for (const auto &service : services()) {
    if (normalize_uuid(service.uuid) == wanted) {
      return true;
    }
  }
  return false;
}

Result<std::unique_ptr<GattTransport>> create_default_transport() {
#if defined(POLARLINK_BLUETOOTH_BLUEZ)
  std::unique_ptr<GattTransport> transport =
      std::make_unique<platform::BlueZTransport>();
  return Result<std::unique_ptr<GattTransport>>(std::move(transport));
#else
  return Error(ErrorCode::NotSupported,
               "Built without a Bluetooth backend");
#endif
}

} // namespace polarlink
