/**
 * @file pmd.cpp
 * @brief Polar Measurement Data codec implementation
 */

#include "polarlink/pmd.h"
#include <string>

namespace polarlink {

namespace {

void append_u16_le(Bytes &out, uint16_t value) {
  out.push_back(static_cast<Byte>(value & 0xFF));
  out.push_back(static_cast<Byte>((value >> 8) & 0xFF));
}

} // namespace

// ============================================================================
// Status Names
// ============================================================================

const char *pmd_response_status_name(PmdResponseStatus status) {
  switch (status) {
  case PmdResponseStatus::Success:
    return "Success";
  case PmdResponseStatus::InvalidOpCode:
    return "InvalidOpCode";
  case PmdResponseStatus::InvalidMeasurementType:
    return "InvalidMeasurementType";
  case PmdResponseStatus::NotSupported:
    return "NotSupported";
  case PmdResponseStatus::InvalidLength:
    return "InvalidLength";
  case PmdResponseStatus::InvalidParameter:
    return "InvalidParameter";
  case PmdResponseStatus::AlreadyInState:
    return "AlreadyInState";
  case PmdResponseStatus::InvalidResolution:
    return "InvalidResolution";
  case PmdResponseStatus::InvalidSampleRate:
    return "InvalidSampleRate";
  case PmdResponseStatus::InvalidRange:
    return "InvalidRange";
  case PmdResponseStatus::InvalidMtu:
    return "InvalidMtu";
  case PmdResponseStatus::InvalidNumberOfChannels:
    return "InvalidNumberOfChannels";
  case PmdResponseStatus::InvalidState:
    return "InvalidState";
  case PmdResponseStatus::DeviceInCharger:
    return "DeviceInCharger";
  default:
    return "Unknown";
  }
}

// ============================================================================
// Commands
// ============================================================================

Bytes build_start_ecg_command(const EcgStreamSettings &settings) {
  Bytes cmd;
  cmd.reserve(10);
  cmd.push_back(static_cast<Byte>(PmdOpCode::StartMeasurement));
  cmd.push_back(static_cast<Byte>(PmdMeasurementType::Ecg));

  cmd.push_back(static_cast<Byte>(PmdSettingType::SampleRate));
  cmd.push_back(0x01);
  append_u16_le(cmd, settings.sample_rate_hz);

  cmd.push_back(static_cast<Byte>(PmdSettingType::Resolution));
  cmd.push_back(0x01);
  append_u16_le(cmd, settings.resolution_bits);

  return cmd;
}

Bytes build_stop_command(PmdMeasurementType type) {
  return {static_cast<Byte>(PmdOpCode::StopMeasurement),
          static_cast<Byte>(type)};
}

Bytes build_get_settings_command(PmdMeasurementType type) {
  return {static_cast<Byte>(PmdOpCode::GetMeasurementSettings),
          static_cast<Byte>(type)};
}

// ============================================================================
// Control Responses
// ============================================================================

Result<PmdControlResponse> parse_control_response(const Bytes &data) {
  if (data.size() < 4) {
    return Error(ErrorCode::InvalidData, "PMD control response too short",
                 std::to_string(data.size()) + " bytes");
  }
  if (data[0] != PMD_CONTROL_RESPONSE_CODE) {
    return Error(ErrorCode::InvalidData, "Not a PMD control response");
  }

  PmdControlResponse response;
  response.op_code = static_cast<PmdOpCode>(data[1]);
  response.measurement_type = static_cast<PmdMeasurementType>(data[2]);
  response.status = static_cast<PmdResponseStatus>(data[3]);

  if (data.size() > 4) {
    response.more = data[4] != 0;
  }
  if (data.size() > 5) {
    response.parameters.assign(data.begin() + 5, data.end());
  }

  return response;
}

Result<std::map<PmdSettingType, std::vector<uint16_t>>>
parse_settings(const Bytes &parameters) {
  std::map<PmdSettingType, std::vector<uint16_t>> settings;

  size_t offset = 0;
  while (offset < parameters.size()) {
    if (offset + 2 > parameters.size()) {
      return Error(ErrorCode::InvalidData, "Truncated setting header");
    }

    auto type = static_cast<PmdSettingType>(parameters[offset]);
    size_t count = parameters[offset + 1];
    offset += 2;

    if (offset + count * 2 > parameters.size()) {
      return Error(ErrorCode::InvalidData, "Truncated setting values");
    }

    auto &values = settings[type];
    for (size_t i = 0; i < count; ++i) {
      values.push_back(static_cast<uint16_t>(
          parameters[offset] | (parameters[offset + 1] << 8)));
      offset += 2;
    }
  }

  return settings;
}

// ============================================================================
// ECG Frames
// ============================================================================

int32_t decode_int24_le(const Byte *p) {
  uint32_t raw = static_cast<uint32_t>(p[0]) |
                 (static_cast<uint32_t>(p[1]) << 8) |
                 (static_cast<uint32_t>(p[2]) << 16);
  if (raw & 0x00800000u) {
    raw |= 0xFF000000u;
  }
  return static_cast<int32_t>(raw);
}

Result<EcgFrame> parse_ecg_frame(const Bytes &data) {
  if (data.empty()) {
    return Error(ErrorCode::InvalidData, "Empty PMD data frame");
  }
  if (data[0] != static_cast<Byte>(PmdMeasurementType::Ecg)) {
    return Error(ErrorCode::UnsupportedFrame, "Not an ECG frame",
                 "measurement type " + std::to_string(data[0]));
  }
  if (data.size() < PMD_ECG_HEADER_SIZE) {
    return Error(ErrorCode::InvalidData, "ECG frame header truncated");
  }
  if (data[9] != PMD_FRAME_TYPE_RAW) {
    return Error(ErrorCode::UnsupportedFrame, "Unsupported ECG frame type",
                 "frame type " + std::to_string(data[9]));
  }

  size_t payload = data.size() - PMD_ECG_HEADER_SIZE;
  if (payload % 3 != 0) {
    return Error(ErrorCode::InvalidData, "ECG payload not a multiple of 3",
                 std::to_string(payload) + " bytes");
  }

  EcgFrame frame;
  for (int i = 7; i >= 0; --i) {
    frame.timestamp_ns = (frame.timestamp_ns << 8) | data[1 + i];
  }

  frame.samples_uv.reserve(payload / 3);
  for (size_t offset = PMD_ECG_HEADER_SIZE; offset < data.size();
       offset += 3) {
    frame.samples_uv.push_back(decode_int24_le(&data[offset]));
  }

  return frame;
}

std::vector<EcgSample> EcgFrame::to_samples(uint16_t sample_rate_hz) const {
  std::vector<EcgSample> samples;
  samples.reserve(samples_uv.size());

  const uint64_t period_ns =
      sample_rate_hz > 0 ? 1000000000ull / sample_rate_hz : 0;
  const size_t n = samples_uv.size();

  for (size_t i = 0; i < n; ++i) {
    uint64_t back = period_ns * (n - 1 - i);
    EcgSample s;
    s.timestamp_ns = timestamp_ns >= back ? timestamp_ns - back : 0;
    s.microvolts = samples_uv[i];
    samples.push_back(s);
  }

  return samples;
}

} // namespace polarlink
