/**
 * @file polarlink.h
 * @brief Main PolarLink API Header
 *
 * PolarLink - Polar H10 heart rate and ECG client for Linux
 *
 * This is the main header file for the PolarLink library. It provides:
 * - BLE discovery and connection (via BlueZ)
 * - Heart rate notifications with signal quality scoring
 * - ECG streaming over the Polar Measurement Data service
 * - Automatic reconnection after link loss
 * - CSV recording
 *
 * Quick Start:
 * @code
 *   #include <polarlink/polarlink.h>
 *
 *   auto transport = polarlink::create_default_transport();
 *   polarlink::PolarH10 device(std::move(transport.value()));
 *
 *   device.connect();
 *   device.start_hr_monitoring([](const polarlink::HeartRateReading& r) {
 *       std::cout << "Heart Rate: " << r.measurement.bpm << " BPM\n";
 *   });
 * @endcode
 */

#ifndef POLARLINK_POLARLINK_H
#define POLARLINK_POLARLINK_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"
#include "log.h"

// Feature modules (in dependency order)
#include "config.h"
#include "data_logger.h"
#include "data_quality.h"
#include "heart_rate.h"
#include "hr_series.h"
#include "pmd.h"
#include "polar_device.h"
#include "reconnect.h"
#include "sample_buffer.h"
#include "state_machine.h"
#include "transport.h"

namespace polarlink {

// ============================================================================
// Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "0.2.0";

struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  bool bluetooth_backend = false;
  const char *build_date = __DATE__;
  const char *build_time = __TIME__;
};

POLARLINK_API VersionInfo get_version();

} // namespace polarlink

#endif // POLARLINK_POLARLINK_H
