/**
 * @file fake_transport.h
 * @brief Scripted GattTransport for exercising PolarH10 without hardware
 *
 * Answers PMD control point writes synchronously through the registered
 * control handler, records every write, and lets tests push
 * notifications or drop the link.
 */

#ifndef POLARLINK_TESTS_FAKE_TRANSPORT_H
#define POLARLINK_TESTS_FAKE_TRANSPORT_H

#include <polarlink/heart_rate.h>
#include <polarlink/pmd.h>
#include <polarlink/transport.h>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace polarlink {
namespace test {

/// Heart rate notification with an 8-bit value and sensor contact
inline Bytes hr_payload(int bpm) {
  return {0x06, static_cast<Byte>(bpm)};
}

/// Raw ECG frame with the given samples
inline Bytes ecg_payload(uint64_t timestamp_ns,
                         const std::vector<int32_t> &samples) {
  Bytes frame;
  frame.push_back(static_cast<Byte>(PmdMeasurementType::Ecg));
  for (int i = 0; i < 8; ++i) {
    frame.push_back(static_cast<Byte>(timestamp_ns >> (8 * i)));
  }
  frame.push_back(PMD_FRAME_TYPE_RAW);
  for (int32_t s : samples) {
    uint32_t raw = static_cast<uint32_t>(s);
    frame.push_back(static_cast<Byte>(raw));
    frame.push_back(static_cast<Byte>(raw >> 8));
    frame.push_back(static_cast<Byte>(raw >> 16));
  }
  return frame;
}

inline BleDeviceInfo polar_h10_device() {
  BleDeviceInfo d;
  d.name = "Polar H10 A1B2C3D4";
  d.address = "A0:9E:1A:A1:B2:C3";
  d.rssi_dbm = -60;
  return d;
}

class FakeTransport : public GattTransport {
public:
  FakeTransport() {
    devices.push_back(polar_h10_device());
    services_list.push_back({HEART_RATE_SERVICE_UUID,
                             {HEART_RATE_MEASUREMENT_UUID}});
    services_list.push_back(
        {PMD_SERVICE_UUID, {PMD_CONTROL_UUID, PMD_DATA_UUID}});
  }

  // ========================================================================
  // Script
  // ========================================================================

  std::vector<BleDeviceInfo> devices;
  std::vector<GattServiceInfo> services_list;

  /// Fail this many connect() calls before succeeding
  std::atomic<int> connect_failures{0};

  /// Status byte sent back for PMD commands
  std::atomic<PmdResponseStatus> control_status{PmdResponseStatus::Success};

  /// Swallow control point writes without answering
  std::atomic<bool> control_silent{false};

  // ========================================================================
  // Observations
  // ========================================================================

  std::atomic<int> scan_calls{0};
  std::atomic<int> connect_calls{0};
  std::atomic<int> disconnect_calls{0};

  std::vector<Bytes> control_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return control_writes_;
  }

  bool is_subscribed(const std::string &uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(normalize_uuid(uuid)) != 0;
  }

  std::string last_connect_address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_address_;
  }

  // ========================================================================
  // Events
  // ========================================================================

  /// Deliver a notification as the BLE stack would
  bool notify(const std::string &uuid, const Bytes &value) {
    NotificationHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(normalize_uuid(uuid));
      if (it == handlers_.end()) {
        return false;
      }
      handler = it->second;
    }
    handler(value);
    return true;
  }

  /// Remote side drops the link
  void drop_link() {
    DisconnectHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      connected_ = false;
      handlers_.clear();
      handler = disconnect_handler_;
    }
    if (handler) {
      handler();
    }
  }

  // ========================================================================
  // GattTransport
  // ========================================================================

  Result<std::vector<BleDeviceInfo>>
  scan(std::chrono::milliseconds) override {
    ++scan_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    return devices;
  }

  Result<void> connect(const std::string &address,
                       std::chrono::milliseconds) override {
    ++connect_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    last_address_ = address;
    if (connect_failures > 0) {
      --connect_failures;
      return Error(ErrorCode::ConnectionFailed, "Scripted connect failure");
    }
    connected_ = true;
    return Result<void>::ok();
  }

  Result<void> disconnect() override {
    ++disconnect_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    handlers_.clear();
    return Result<void>::ok();
  }

  bool is_connected() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
  }

  std::vector<GattServiceInfo> services() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_ ? services_list : std::vector<GattServiceInfo>();
  }

  Result<void> write(const std::string &char_uuid,
                     const Bytes &data) override {
    NotificationHandler control;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!connected_) {
        return Error(ErrorCode::NotConnected, "Not connected");
      }
      if (normalize_uuid(char_uuid) != normalize_uuid(PMD_CONTROL_UUID)) {
        return Result<void>::ok();
      }
      control_writes_.push_back(data);
      if (control_silent || data.size() < 2) {
        return Result<void>::ok();
      }
      auto it = handlers_.find(normalize_uuid(PMD_CONTROL_UUID));
      if (it != handlers_.end()) {
        control = it->second;
      }
    }

    if (control) {
      control({PMD_CONTROL_RESPONSE_CODE, data[0], data[1],
               static_cast<Byte>(control_status.load()), 0x00});
    }
    return Result<void>::ok();
  }

  Result<void> start_notify(const std::string &char_uuid,
                            NotificationHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
      return Error(ErrorCode::NotConnected, "Not connected");
    }
    handlers_[normalize_uuid(char_uuid)] = std::move(handler);
    return Result<void>::ok();
  }

  Result<void> stop_notify(const std::string &char_uuid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(normalize_uuid(char_uuid));
    return Result<void>::ok();
  }

  void on_disconnected(DisconnectHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_handler_ = std::move(handler);
  }

private:
  mutable std::mutex mutex_;
  bool connected_ = false;
  std::string last_address_;
  std::map<std::string, NotificationHandler> handlers_;
  std::vector<Bytes> control_writes_;
  DisconnectHandler disconnect_handler_;
};

} // namespace test
} // namespace polarlink

#endif // POLARLINK_TESTS_FAKE_TRANSPORT_H
