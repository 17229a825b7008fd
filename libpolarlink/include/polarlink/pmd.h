/**
 * @file pmd.h
 * @brief Polar Measurement Data (PMD) service codec
 *
 * The PMD service carries raw sensor streams. A client writes commands
 * to the control point and receives responses as indications on the
 * same characteristic; samples arrive as notifications on the data
 * characteristic.
 *
 * Control command:   [op][measurement type][setting type][count][u16]*...
 * Control response:  [0xF0][op][measurement type][status][more][params...]
 * ECG data frame:    [type=0x00][timestamp:u64 ns][frame type=0x00]
 *                    [sample:i24]*   (microvolts, little-endian)
 */

#ifndef POLARLINK_PMD_H
#define POLARLINK_PMD_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <map>
#include <vector>

namespace polarlink {

// ============================================================================
// UUIDs
// ============================================================================

constexpr const char *PMD_SERVICE_UUID = "fb005c80-02e7-f387-1cad-8acd2d8df0c8";
constexpr const char *PMD_CONTROL_UUID = "fb005c81-02e7-f387-1cad-8acd2d8df0c8";
constexpr const char *PMD_DATA_UUID = "fb005c82-02e7-f387-1cad-8acd2d8df0c8";

// ============================================================================
// Protocol Enumerations
// ============================================================================

enum class PmdMeasurementType : uint8_t {
  Ecg = 0x00,
  Ppg = 0x01,
  Acc = 0x02,
  Ppi = 0x03,
  Gyro = 0x05,
  Mag = 0x06
};

enum class PmdOpCode : uint8_t {
  GetMeasurementSettings = 0x01,
  StartMeasurement = 0x02,
  StopMeasurement = 0x03
};

enum class PmdSettingType : uint8_t {
  SampleRate = 0x00,
  Resolution = 0x01,
  Range = 0x02
};

enum class PmdResponseStatus : uint8_t {
  Success = 0,
  InvalidOpCode = 1,
  InvalidMeasurementType = 2,
  NotSupported = 3,
  InvalidLength = 4,
  InvalidParameter = 5,
  AlreadyInState = 6,
  InvalidResolution = 7,
  InvalidSampleRate = 8,
  InvalidRange = 9,
  InvalidMtu = 10,
  InvalidNumberOfChannels = 11,
  InvalidState = 12,
  DeviceInCharger = 13
};

POLARLINK_API const char *pmd_response_status_name(PmdResponseStatus status);

/// First byte of every control point response
constexpr Byte PMD_CONTROL_RESPONSE_CODE = 0xF0;

/// Raw (uncompressed) ECG frame type
constexpr Byte PMD_FRAME_TYPE_RAW = 0x00;

/// Bytes before the first ECG sample
constexpr size_t PMD_ECG_HEADER_SIZE = 10;

// ============================================================================
// Commands
// ============================================================================

/// ECG stream parameters supported by the H10
struct EcgStreamSettings {
  uint16_t sample_rate_hz = 130;
  uint16_t resolution_bits = 14;
};

/// Start ECG measurement (130 Hz / 14 bit: 02 00 00 01 82 00 01 01 0E 00)
POLARLINK_API Bytes build_start_ecg_command(const EcgStreamSettings &settings);

/// Stop a measurement: 03 <type>
POLARLINK_API Bytes build_stop_command(PmdMeasurementType type);

/// Query supported settings: 01 <type>
POLARLINK_API Bytes build_get_settings_command(PmdMeasurementType type);

// ============================================================================
// Control Responses
// ============================================================================

struct PmdControlResponse {
  PmdOpCode op_code = PmdOpCode::GetMeasurementSettings;
  PmdMeasurementType measurement_type = PmdMeasurementType::Ecg;
  PmdResponseStatus status = PmdResponseStatus::Success;
  bool more = false;
  Bytes parameters;

  bool is_success() const { return status == PmdResponseStatus::Success; }
};

POLARLINK_API Result<PmdControlResponse>
parse_control_response(const Bytes &data);

/// Decode a settings block: [setting][count][u16 * count]...
POLARLINK_API Result<std::map<PmdSettingType, std::vector<uint16_t>>>
parse_settings(const Bytes &parameters);

// ============================================================================
// ECG Frames
// ============================================================================

struct EcgFrame {
  uint64_t timestamp_ns = 0; // Sensor time of the last sample
  std::vector<int32_t> samples_uv;

  /// Spread the frame timestamp back over the samples at the given rate
  std::vector<EcgSample> to_samples(uint16_t sample_rate_hz) const;
};

/**
 * @brief Decode a PMD data notification carrying ECG
 * @return UnsupportedFrame for other measurement or frame types,
 *         InvalidData for truncated frames
 */
POLARLINK_API Result<EcgFrame> parse_ecg_frame(const Bytes &data);

/// Sign-extend a 24-bit little-endian integer
POLARLINK_API int32_t decode_int24_le(const Byte *p);

} // namespace polarlink

#endif // POLARLINK_PMD_H
