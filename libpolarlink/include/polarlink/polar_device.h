/**
 * @file polar_device.h
 * @brief Polar H10 chest strap session management
 *
 * PolarH10 drives a single sensor through its whole lifecycle:
 *   1. Discovery (configured address or first name match)
 *   2. Connection with exponential back-off retries
 *   3. Heart rate notifications (0x2A37) with quality scoring
 *   4. ECG streaming over the Polar Measurement Data service
 *   5. Link supervision: silent-link watchdog, automatic reconnect and
 *      restoration of active subscriptions
 */

#ifndef POLARLINK_POLAR_DEVICE_H
#define POLARLINK_POLAR_DEVICE_H

#include "error.h"
#include "platform.h"
#include "pmd.h"
#include "reconnect.h"
#include "state_machine.h"
#include "transport.h"
#include "types.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace polarlink {

// ============================================================================
// Device Configuration
// ============================================================================

struct PolarDeviceConfig {
  /// Connect to this address instead of scanning by name
  std::string device_address;

  /// Substring of the advertised name that identifies the sensor
  std::string name_filter = "Polar H10";

  std::chrono::milliseconds scan_timeout{10000};
  std::chrono::milliseconds connect_timeout{20000};

  /// Wait for a PMD control point response
  std::chrono::milliseconds control_timeout{5000};

  ReconnectPolicy reconnect;

  /// Link is considered lost after this long without data
  std::chrono::milliseconds data_timeout{5000};

  /// Supervisor polling period
  std::chrono::milliseconds monitor_interval{1000};

  size_t quality_buffer_size = 60;

  /// Ten seconds at 130 Hz
  size_t ecg_buffer_capacity = 1300;

  EcgStreamSettings ecg;

  bool auto_reconnect = true;
};

// ============================================================================
// Polar H10
// ============================================================================

/**
 * @brief Client session for one Polar H10
 *
 * Example usage:
 * @code
 *   auto transport = create_default_transport();
 *   PolarH10 device(std::move(transport.value()));
 *
 *   device.on_error([](const Error& err) {
 *       std::cerr << err.to_string() << std::endl;
 *   });
 *
 *   if (device.connect()) {
 *       device.start_hr_monitoring([](const HeartRateReading& r) {
 *           std::cout << "Heart Rate: " << r.measurement.bpm << " BPM\n";
 *       });
 *   }
 * @endcode
 *
 * Callbacks run on the transport's notification thread or on the
 * supervisor thread, never while internal locks are held.
 */
class POLARLINK_API PolarH10 {
public:
  explicit PolarH10(std::shared_ptr<GattTransport> transport,
                    PolarDeviceConfig config = PolarDeviceConfig());
  ~PolarH10();

  // Non-copyable
  PolarH10(const PolarH10 &) = delete;
  PolarH10 &operator=(const PolarH10 &) = delete;

  // ========================================================================
  // Connection
  // ========================================================================

  /**
   * @brief Locate the sensor
   * @return DeviceNotFound if nothing matched within the scan timeout
   */
  Result<BleDeviceInfo> discover();

  /**
   * @brief Connect and verify the required services
   * @param retry_on_fail Retry with back-off until the policy gives up
   * @return The last attempt's error on failure
   */
  Result<void> connect(bool retry_on_fail = true);

  /**
   * @brief Stop streams and supervision, then drop the link
   */
  Result<void> disconnect();

  ConnectionState connection_state() const;
  bool is_connected() const;

  /// The device found by discover(), if any
  std::optional<BleDeviceInfo> device_info() const;

  const PolarDeviceConfig &config() const;

  // ========================================================================
  // Heart Rate
  // ========================================================================

  Result<void> start_hr_monitoring(HeartRateCallback callback);
  Result<void> stop_hr_monitoring();

  /**
   * @brief Decode and validate one heart rate notification
   *
   * Updates the last heart rate and feeds the data watchdog on success.
   */
  Result<HeartRateMeasurement> process_heart_rate_data(const Bytes &data);

  std::optional<int> last_heart_rate() const;
  std::optional<QualityStats> get_quality_stats() const;

  // ========================================================================
  // ECG
  // ========================================================================

  /**
   * @brief Start the PMD ECG stream
   * @return NotConnected, StreamAlreadyActive, Timeout or
   *         ControlCommandFailed on failure
   */
  Result<void> start_ecg_stream(EcgCallback callback);

  /// No-op when no stream is active
  Result<void> stop_ecg_stream();

  bool is_ecg_streaming() const;

  /// Newest n buffered samples, oldest first
  std::vector<EcgSample> recent_ecg_samples(size_t n) const;

  // ========================================================================
  // Services
  // ========================================================================

  /**
   * @brief Check that heart rate and PMD services are present
   * @return ServicesMissing naming what was not found
   */
  Result<void> validate_services() const;

  // ========================================================================
  // Callbacks
  // ========================================================================

  void on_state_changed(std::function<void(ConnectionState)> callback);

  /// Link loss and failed reconnects
  void on_error(std::function<void(const Error &)> callback);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace polarlink

#endif // POLARLINK_POLAR_DEVICE_H
