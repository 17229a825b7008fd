/**
 * @file heart_rate.cpp
 * @brief Heart Rate Measurement decoder
 */

#include "polarlink/heart_rate.h"
#include <string>

namespace polarlink {

namespace {

constexpr Byte FLAG_HR_UINT16 = 0x01;
constexpr Byte FLAG_CONTACT_DETECTED = 0x02;
constexpr Byte FLAG_CONTACT_SUPPORTED = 0x04;
constexpr Byte FLAG_ENERGY_PRESENT = 0x08;
constexpr Byte FLAG_RR_PRESENT = 0x10;

uint16_t read_u16_le(const Bytes &data, size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

} // namespace

Result<HeartRateMeasurement> parse_heart_rate_measurement(const Bytes &data) {
  if (data.size() < 2) {
    return Error(ErrorCode::InvalidData, "Invalid heart rate data format",
                 "payload has " + std::to_string(data.size()) + " bytes");
  }

  HeartRateMeasurement m;
  const Byte flags = data[0];
  size_t offset = 1;

  if (flags & FLAG_HR_UINT16) {
    if (data.size() < offset + 2) {
      return Error(ErrorCode::InvalidData, "Truncated 16-bit heart rate");
    }
    m.bpm = read_u16_le(data, offset);
    offset += 2;
  } else {
    m.bpm = data[offset];
    offset += 1;
  }

  m.sensor_contact_supported = (flags & FLAG_CONTACT_SUPPORTED) != 0;
  m.sensor_contact_detected =
      m.sensor_contact_supported && (flags & FLAG_CONTACT_DETECTED) != 0;

  if (flags & FLAG_ENERGY_PRESENT) {
    if (data.size() < offset + 2) {
      return Error(ErrorCode::InvalidData, "Truncated energy expended field");
    }
    m.energy_expended_kj = read_u16_le(data, offset);
    offset += 2;
  }

  if (flags & FLAG_RR_PRESENT) {
    if ((data.size() - offset) % 2 != 0) {
      return Error(ErrorCode::InvalidData, "Dangling byte in RR intervals");
    }
    while (offset + 1 < data.size()) {
      m.rr_intervals.push_back(read_u16_le(data, offset));
      offset += 2;
    }
  }

  return m;
}

Result<void> validate_heart_rate(int bpm) {
  if (bpm < MIN_VALID_BPM || bpm > MAX_VALID_BPM) {
    return Error(ErrorCode::ValueOutOfRange,
                 "Heart rate value " + std::to_string(bpm) +
                     " outside valid range (30-240 BPM)");
  }
  return Result<void>::ok();
}

} // namespace polarlink
