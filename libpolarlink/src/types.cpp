/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "polarlink/types.h"
#include <algorithm>
#include <cctype>

namespace polarlink {

// ============================================================================
// BleDeviceInfo
// ============================================================================

bool BleDeviceInfo::is_polar_h10() const {
  return name.find("Polar H10") != std::string::npos;
}

std::string normalize_uuid(const std::string &uuid) {
  std::string out = uuid;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool is_valid_ble_address(const std::string &address) {
  if (address.size() != 17) {
    return false;
  }

  for (size_t i = 0; i < address.size(); ++i) {
    char c = address[i];
    if (i % 3 == 2) {
      if (c != ':') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// HeartRateMeasurement
// ============================================================================

std::vector<double> HeartRateMeasurement::rr_intervals_ms() const {
  std::vector<double> result;
  result.reserve(rr_intervals.size());
  for (uint16_t rr : rr_intervals) {
    result.push_back(static_cast<double>(rr) * 1000.0 / 1024.0);
  }
  return result;
}

// ============================================================================
// MonitorMode
// ============================================================================

const char *monitor_mode_name(MonitorMode mode) {
  switch (mode) {
  case MonitorMode::HeartRate:
    return "HR";
  case MonitorMode::Ecg:
    return "ECG";
  default:
    return "Unknown";
  }
}

std::optional<MonitorMode> parse_monitor_mode(const std::string &s) {
  std::string upper = s;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "HR") {
    return MonitorMode::HeartRate;
  }
  if (upper == "ECG") {
    return MonitorMode::Ecg;
  }
  return std::nullopt;
}

} // namespace polarlink
