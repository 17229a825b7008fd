/**
 * @file types.h
 * @brief Core type definitions for PolarLink
 */

#ifndef POLARLINK_TYPES_H
#define POLARLINK_TYPES_H

#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace polarlink {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

// ============================================================================
// BLE Devices
// ============================================================================

/// Information about a device seen during a BLE scan
struct BleDeviceInfo {
  std::string name;    // Advertised name (may be empty)
  std::string address; // MAC address, "AA:BB:CC:DD:EE:FF"
  int rssi_dbm = -100; // Signal strength
  std::vector<std::string> service_uuids;

  /// True if the advertised name identifies a Polar H10 strap
  bool is_polar_h10() const;
};

/// Lower-cases a UUID string so lookups are case-insensitive
POLARLINK_API std::string normalize_uuid(const std::string &uuid);

/// Checks the "XX:XX:XX:XX:XX:XX" hex form
POLARLINK_API bool is_valid_ble_address(const std::string &address);

// ============================================================================
// Heart Rate
// ============================================================================

/// Decoded Heart Rate Measurement characteristic (0x2A37)
struct HeartRateMeasurement {
  int bpm = 0;
  bool sensor_contact_supported = false;
  bool sensor_contact_detected = false;
  std::optional<uint16_t> energy_expended_kj;

  /// RR intervals in units of 1/1024 s, oldest first
  std::vector<uint16_t> rr_intervals;

  /// RR intervals converted to milliseconds
  std::vector<double> rr_intervals_ms() const;
};

/// Rolling signal quality summary
struct QualityStats {
  double signal_quality = 100.0; // 0-100, mean of the newest scores
  int data_gaps = 0;
  int anomalies = 0;
  double mean_hr = 0.0;
  double std_dev = 0.0;
  size_t buffer_size = 0;
};

/// One validated heart rate notification as delivered to callers
struct HeartRateReading {
  HeartRateMeasurement measurement;
  std::chrono::system_clock::time_point timestamp;
  std::optional<QualityStats> quality;
};

// ============================================================================
// ECG
// ============================================================================

/// Single ECG sample in sensor time
struct EcgSample {
  uint64_t timestamp_ns = 0; // Sensor clock, nanoseconds
  int32_t microvolts = 0;
  int data_quality = 1;
};

// ============================================================================
// Monitor Mode
// ============================================================================

enum class MonitorMode : uint8_t { HeartRate = 0, Ecg = 1 };

/// "HR" or "ECG"
POLARLINK_API const char *monitor_mode_name(MonitorMode mode);

/// Parses "HR"/"ECG" (case-insensitive)
POLARLINK_API std::optional<MonitorMode> parse_monitor_mode(const std::string &s);

// ============================================================================
// Callbacks
// ============================================================================

using HeartRateCallback = std::function<void(const HeartRateReading &reading)>;
using EcgCallback = std::function<void(const EcgSample &sample)>;

} // namespace polarlink

#endif // POLARLINK_TYPES_H
