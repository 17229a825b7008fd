/**
 * @file heart_rate.h
 * @brief Bluetooth Heart Rate Service decoding
 *
 * The Polar H10 exposes the standard Heart Rate Service (0x180D). Its
 * Heart Rate Measurement characteristic (0x2A37) notifies about once a
 * second with the layout:
 *
 *   [flags:u8][bpm:u8|u16][energy:u16]?[rr:u16]*
 *
 *   flags bit 0  bpm is u16
 *   flags bit 1  sensor contact detected
 *   flags bit 2  sensor contact supported
 *   flags bit 3  energy expended present (kJ)
 *   flags bit 4  RR intervals present (1/1024 s)
 *
 * All multi-byte fields are little-endian.
 */

#ifndef POLARLINK_HEART_RATE_H
#define POLARLINK_HEART_RATE_H

#include "error.h"
#include "platform.h"
#include "types.h"

namespace polarlink {

constexpr const char *HEART_RATE_SERVICE_UUID =
    "0000180d-0000-1000-8000-00805f9b34fb";
constexpr const char *HEART_RATE_MEASUREMENT_UUID =
    "00002a37-0000-1000-8000-00805f9b34fb";

/// Plausible physiological range accepted from the sensor
constexpr int MIN_VALID_BPM = 30;
constexpr int MAX_VALID_BPM = 240;

/**
 * @brief Decode a Heart Rate Measurement notification
 * @param data Raw characteristic value
 * @return Decoded measurement, or InvalidData if the payload is truncated
 */
POLARLINK_API Result<HeartRateMeasurement>
parse_heart_rate_measurement(const Bytes &data);

/**
 * @brief Check that a heart rate is physiologically plausible
 * @return ValueOutOfRange outside [MIN_VALID_BPM, MAX_VALID_BPM]
 */
POLARLINK_API Result<void> validate_heart_rate(int bpm);

} // namespace polarlink

#endif // POLARLINK_HEART_RATE_H
