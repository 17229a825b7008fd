/**
 * @file polar_device.cpp
 * @brief Polar H10 session implementation
 */

#include "polarlink/polar_device.h"
#include "polarlink/data_quality.h"
#include "polarlink/heart_rate.h"
#include "polarlink/log.h"
#include "polarlink/sample_buffer.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace polarlink {

namespace {
constexpr const char *LOG_MODULE = "polar_device";
} // namespace

// ============================================================================
// PolarH10 Implementation
// ============================================================================

class PolarH10::Impl {
public:
  Impl(std::shared_ptr<GattTransport> t, PolarDeviceConfig c)
      : transport(std::move(t)), config(std::move(c)),
        quality(config.quality_buffer_size),
        ecg_buffer(config.ecg_buffer_capacity),
        watchdog(config.data_timeout) {}

  std::shared_ptr<GattTransport> transport;
  PolarDeviceConfig config;

  ConnectionStateMachine link;
  StreamStateMachine ecg_stream;
  DataQualityMonitor quality;

  // Guarded by mutex
  mutable std::mutex mutex;
  std::optional<BleDeviceInfo> device;
  std::optional<int> last_hr;
  SampleRing<EcgSample> ecg_buffer;
  ConnectionWatchdog watchdog;
  HeartRateCallback hr_cb;
  EcgCallback ecg_cb;
  bool hr_active = false;
  bool ecg_active = false;
  std::optional<PmdControlResponse> control_response;
  std::condition_variable control_cv;
  std::function<void(ConnectionState)> state_changed_cb;
  std::function<void(const Error &)> error_cb;

  // Supervisor
  std::thread supervisor;
  std::atomic<bool> supervisor_stop{false};
  std::atomic<bool> link_lost{false};
  std::condition_variable supervisor_cv;

  // ------------------------------------------------------------------------
  // Connection
  // ------------------------------------------------------------------------

  Result<BleDeviceInfo> discover();
  Result<void> connect_once();
  Result<void> check_services() const;
  void fail_attempt();

  // ------------------------------------------------------------------------
  // Subscriptions
  // ------------------------------------------------------------------------

  Result<void> subscribe_hr();
  Result<void> start_ecg();
  Result<void> stop_ecg();
  Result<PmdControlResponse> send_control(const Bytes &command);

  Result<HeartRateMeasurement> process_hr(const Bytes &data);
  void handle_hr_notification(const Bytes &data);
  void handle_control_notification(const Bytes &data);
  void handle_ecg_notification(const Bytes &data);

  // ------------------------------------------------------------------------
  // Supervision
  // ------------------------------------------------------------------------

  void start_supervisor();
  void stop_supervisor();
  void supervise();
  bool recover_link();
  bool wait_supervisor(std::chrono::milliseconds duration);

  void emit_error(const Error &err) {
    std::function<void(const Error &)> cb;
    {
      std::lock_guard<std::mutex> lock(mutex);
      cb = error_cb;
    }
    if (cb) {
      cb(err);
    }
  }
};

// ============================================================================
// Discovery and Connection
// ============================================================================

Result<BleDeviceInfo> PolarH10::Impl::discover() {
  if (!config.device_address.empty()) {
    POLARLINK_REQUIRE(is_valid_ble_address(config.device_address),
                      ErrorCode::InvalidArgument,
                      "Invalid device address: " + config.device_address);

    BleDeviceInfo info;
    info.address = config.device_address;
    info.name = config.name_filter;
    {
      std::lock_guard<std::mutex> lock(mutex);
      device = info;
    }
    return info;
  }

  POLARLINK_LOG_INFO(LOG_MODULE, "Scanning for devices matching '"
                                     << config.name_filter << "'");

  const std::string filter = config.name_filter;
  auto found = transport->find_device(
      [&filter](const BleDeviceInfo &d) {
        return d.name.find(filter) != std::string::npos;
      },
      config.scan_timeout);

  if (found.is_error()) {
    if (found.error().code == ErrorCode::DeviceNotFound) {
      return Error(ErrorCode::DeviceNotFound, "No Polar H10 device found");
    }
    return found.error();
  }

  POLARLINK_LOG_INFO(LOG_MODULE, "Found " << found.value().name << " ("
                                          << found.value().address << ")");
  {
    std::lock_guard<std::mutex> lock(mutex);
    device = found.value();
  }
  return found;
}

Result<void> PolarH10::Impl::connect_once() {
  POLARLINK_TRY(link.transition(ConnectionState::Connecting));

  std::optional<BleDeviceInfo> target;
  {
    std::lock_guard<std::mutex> lock(mutex);
    target = device;
  }

  if (!target) {
    auto found = discover();
    if (found.is_error()) {
      fail_attempt();
      return found.error();
    }
    target = found.value();
  }

  transport->on_disconnected([this]() {
    if (link.current() == ConnectionState::Connected) {
      POLARLINK_LOG_WARN(LOG_MODULE, "Device disconnected unexpectedly");
      link_lost = true;
      supervisor_cv.notify_all();
    }
  });

  POLARLINK_LOG_DEBUG(LOG_MODULE, "Attempting connection to "
                                      << target->address);
  auto connected = transport->connect(target->address, config.connect_timeout);
  if (connected.is_error()) {
    fail_attempt();
    return connected.error();
  }

  auto services = check_services();
  if (services.is_error()) {
    fail_attempt();
    return services.error();
  }

  {
    std::lock_guard<std::mutex> lock(mutex);
    watchdog.reset();
  }
  link_lost = false;

  POLARLINK_TRY(link.transition(ConnectionState::Connected));
  POLARLINK_LOG_INFO(LOG_MODULE, "Successfully connected to "
                                     << (target->name.empty() ? target->address
                                                              : target->name));
  return Result<void>::ok();
}

Result<void> PolarH10::Impl::check_services() const {
  std::string missing;
  if (!transport->has_service(HEART_RATE_SERVICE_UUID)) {
    missing = HEART_RATE_SERVICE_UUID;
  }
  if (!transport->has_service(PMD_SERVICE_UUID)) {
    missing += missing.empty() ? "" : ", ";
    missing += PMD_SERVICE_UUID;
  }

  if (!missing.empty()) {
    return Error(ErrorCode::ServicesMissing,
                 "Required services not found on device", missing);
  }
  return Result<void>::ok();
}

void PolarH10::Impl::fail_attempt() {
  auto moved = link.transition(ConnectionState::Error);
  if (moved.is_error()) {
    POLARLINK_LOG_DEBUG(LOG_MODULE, moved.error().message);
  }

  auto dropped = transport->disconnect();
  if (dropped.is_error()) {
    POLARLINK_LOG_DEBUG(LOG_MODULE, "Cleanup disconnect failed: "
                                        << dropped.error().message);
  }
}

// ============================================================================
// Heart Rate
// ============================================================================

Result<HeartRateMeasurement> PolarH10::Impl::process_hr(const Bytes &data) {
  auto parsed = parse_heart_rate_measurement(data);
  if (parsed.is_error()) {
    return parsed.error();
  }

  auto valid = validate_heart_rate(parsed.value().bpm);
  if (valid.is_error()) {
    return valid.error();
  }

  std::lock_guard<std::mutex> lock(mutex);
  watchdog.feed();
  last_hr = parsed.value().bpm;
  return parsed;
}

void PolarH10::Impl::handle_hr_notification(const Bytes &data) {
  auto measurement = process_hr(data);
  if (measurement.is_error()) {
    POLARLINK_LOG_WARN(LOG_MODULE, "Invalid heart rate data: "
                                       << measurement.error().message);
    return;
  }

  HeartRateReading reading;
  reading.measurement = measurement.value();
  reading.timestamp = std::chrono::system_clock::now();

  quality.add_reading(reading.timestamp, reading.measurement.bpm);
  reading.quality = quality.get_stats();

  HeartRateCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex);
    cb = hr_cb;
  }
  if (cb) {
    cb(reading);
  }
}

Result<void> PolarH10::Impl::subscribe_hr() {
  auto result = transport->start_notify(
      HEART_RATE_MEASUREMENT_UUID,
      [this](const Bytes &data) { handle_hr_notification(data); });
  if (result.is_error()) {
    return result.error();
  }

  POLARLINK_LOG_INFO(LOG_MODULE, "Heart rate monitoring started");
  return Result<void>::ok();
}

// ============================================================================
// ECG
// ============================================================================

void PolarH10::Impl::handle_control_notification(const Bytes &data) {
  auto response = parse_control_response(data);
  if (response.is_error()) {
    POLARLINK_LOG_WARN(LOG_MODULE, "Ignoring PMD control notification: "
                                       << response.error().message);
    return;
  }

  POLARLINK_LOG_DEBUG(LOG_MODULE,
                      "PMD control response: "
                          << pmd_response_status_name(response.value().status));
  {
    std::lock_guard<std::mutex> lock(mutex);
    control_response = response.value();
  }
  control_cv.notify_all();
}

void PolarH10::Impl::handle_ecg_notification(const Bytes &data) {
  auto frame = parse_ecg_frame(data);
  if (frame.is_error()) {
    POLARLINK_LOG_WARN(LOG_MODULE,
                       "Dropping ECG frame: " << frame.error().message);
    return;
  }

  auto samples = frame.value().to_samples(config.ecg.sample_rate_hz);

  EcgCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex);
    watchdog.feed();
    for (const auto &sample : samples) {
      ecg_buffer.push(sample);
    }
    cb = ecg_cb;
  }

  if (cb) {
    for (const auto &sample : samples) {
      cb(sample);
    }
  }
}

Result<PmdControlResponse> PolarH10::Impl::send_control(const Bytes &command) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    control_response.reset();
  }

  auto written = transport->write(PMD_CONTROL_UUID, command);
  if (written.is_error()) {
    return written.error();
  }

  std::unique_lock<std::mutex> lock(mutex);
  bool answered = control_cv.wait_for(lock, config.control_timeout, [this] {
    return control_response.has_value();
  });
  if (!answered) {
    return Error(ErrorCode::Timeout, "No response from PMD control point");
  }

  PmdControlResponse response = *control_response;
  control_response.reset();
  return response;
}

Result<void> PolarH10::Impl::start_ecg() {
  if (!link.is_connected()) {
    return Error(ErrorCode::NotConnected, "Device not connected");
  }

  auto starting = ecg_stream.transition(StreamState::Starting);
  if (starting.is_error()) {
    return Error(ErrorCode::StreamAlreadyActive, "ECG stream already active");
  }

  auto abort_start = [this](Error err) -> Result<void> {
    auto unsub = transport->stop_notify(PMD_DATA_UUID);
    if (unsub.is_error()) {
      POLARLINK_LOG_DEBUG(LOG_MODULE, unsub.error().message);
    }
    ecg_stream.reset();
    return err;
  };

  auto control = transport->start_notify(
      PMD_CONTROL_UUID,
      [this](const Bytes &data) { handle_control_notification(data); });
  if (control.is_error()) {
    return abort_start(control.error());
  }

  auto stream = transport->start_notify(
      PMD_DATA_UUID,
      [this](const Bytes &data) { handle_ecg_notification(data); });
  if (stream.is_error()) {
    return abort_start(stream.error());
  }

  auto response = send_control(build_start_ecg_command(config.ecg));
  if (response.is_error()) {
    return abort_start(response.error());
  }

  const PmdControlResponse &r = response.value();
  if (!r.is_success() && r.status != PmdResponseStatus::AlreadyInState) {
    return abort_start(Error(ErrorCode::ControlCommandFailed,
                             "ECG start rejected by sensor",
                             pmd_response_status_name(r.status)));
  }

  POLARLINK_TRY(ecg_stream.transition(StreamState::Streaming));
  POLARLINK_LOG_INFO(LOG_MODULE, "ECG streaming started ("
                                     << config.ecg.sample_rate_hz << " Hz, "
                                     << config.ecg.resolution_bits
                                     << " bit)");
  return Result<void>::ok();
}

Result<void> PolarH10::Impl::stop_ecg() {
  if (ecg_stream.current() == StreamState::Idle) {
    return Result<void>::ok();
  }

  auto stopping = ecg_stream.transition(StreamState::Stopping);
  if (stopping.is_error()) {
    // Still starting on another thread
    return stopping.error();
  }

  Result<void> outcome = Result<void>::ok();

  if (link.is_connected()) {
    auto response = send_control(build_stop_command(PmdMeasurementType::Ecg));
    if (response.is_error()) {
      POLARLINK_LOG_WARN(LOG_MODULE, "ECG stop command failed: "
                                         << response.error().message);
      outcome = response.error();
    } else if (!response.value().is_success() &&
               response.value().status != PmdResponseStatus::AlreadyInState) {
      outcome = Error(ErrorCode::ControlCommandFailed,
                      "ECG stop rejected by sensor",
                      pmd_response_status_name(response.value().status));
    }

    auto unsub = transport->stop_notify(PMD_DATA_UUID);
    if (unsub.is_error()) {
      POLARLINK_LOG_WARN(LOG_MODULE, "Failed to unsubscribe ECG data: "
                                         << unsub.error().message);
    }
  }

  auto idle = ecg_stream.transition(StreamState::Idle);
  if (idle.is_error()) {
    ecg_stream.reset();
  }

  POLARLINK_LOG_INFO(LOG_MODULE, "ECG streaming stopped");
  return outcome;
}

// ============================================================================
// Supervision
// ============================================================================

void PolarH10::Impl::start_supervisor() {
  if (supervisor.joinable()) {
    if (supervisor.get_id() == std::this_thread::get_id()) {
      // Reconnect from inside the supervisor keeps using it
      return;
    }
    supervisor_stop = true;
    supervisor_cv.notify_all();
    supervisor.join();
  }

  supervisor_stop = false;
  supervisor = std::thread(&Impl::supervise, this);
}

void PolarH10::Impl::stop_supervisor() {
  supervisor_stop = true;
  supervisor_cv.notify_all();

  if (supervisor.joinable() &&
      supervisor.get_id() != std::this_thread::get_id()) {
    supervisor.join();
  }
}

bool PolarH10::Impl::wait_supervisor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex);
  supervisor_cv.wait_for(lock, duration, [this] {
    return supervisor_stop.load() || link_lost.load();
  });
  return !supervisor_stop.load();
}

void PolarH10::Impl::supervise() {
  POLARLINK_LOG_DEBUG(LOG_MODULE, "Connection supervisor started");

  while (wait_supervisor(config.monitor_interval)) {
    if (link.current() != ConnectionState::Connected) {
      link_lost = false;
      continue;
    }

    std::string reason;
    if (link_lost.exchange(false)) {
      reason = "Device disconnected unexpectedly";
    } else {
      std::lock_guard<std::mutex> lock(mutex);
      if (watchdog.is_expired()) {
        reason = "No data received for " +
                 std::to_string(config.data_timeout.count() / 1000) +
                 " seconds";
      }
    }

    if (reason.empty()) {
      continue;
    }

    POLARLINK_LOG_WARN(LOG_MODULE, reason);
    if (!recover_link()) {
      break;
    }
  }

  POLARLINK_LOG_DEBUG(LOG_MODULE, "Connection supervisor stopped");
}

bool PolarH10::Impl::recover_link() {
  auto lost = link.transition(ConnectionState::Lost);
  if (lost.is_error()) {
    POLARLINK_LOG_DEBUG(LOG_MODULE, lost.error().message);
    return true;
  }

  ecg_stream.reset();
  {
    std::lock_guard<std::mutex> lock(mutex);
    watchdog.reset();
    control_response.reset();
  }

  emit_error(Error(ErrorCode::ConnectionLost, "Connection to device lost"));

  auto dropped = transport->disconnect();
  if (dropped.is_error()) {
    POLARLINK_LOG_DEBUG(LOG_MODULE, "Disconnect after link loss failed: "
                                        << dropped.error().message);
  }

  if (!config.auto_reconnect) {
    link.force_transition(ConnectionState::Disconnected);
    return false;
  }

  const ReconnectPolicy &policy = config.reconnect;
  for (int attempt = 1;; ++attempt) {
    if (supervisor_stop.load()) {
      return false;
    }

    POLARLINK_LOG_INFO(LOG_MODULE, "Reconnection attempt "
                                       << attempt << "/"
                                       << policy.max_attempts);
    auto result = connect_once();
    if (result.is_ok()) {
      break;
    }

    POLARLINK_LOG_WARN(LOG_MODULE,
                       "Reconnection failed: " << result.error().message);

    if (!policy.should_retry(attempt)) {
      link.force_transition(ConnectionState::Disconnected);
      emit_error(Error(ErrorCode::ConnectionFailed,
                       "Auto-reconnection failed after " +
                           std::to_string(attempt) + " attempts",
                       result.error().message));
      return false;
    }

    auto delay = policy.delay_for_attempt(attempt);
    POLARLINK_LOG_INFO(LOG_MODULE, "Retrying connection in "
                                       << delay.count() / 1000.0
                                       << " seconds...");
    // Link-lost wakeups are irrelevant while disconnected
    link_lost = false;
    if (!wait_supervisor(delay)) {
      return false;
    }
  }

  // Restore what the caller had running before the loss
  bool restore_hr = false;
  bool restore_ecg = false;
  {
    std::lock_guard<std::mutex> lock(mutex);
    restore_hr = hr_active;
    restore_ecg = ecg_active;
  }

  if (restore_hr) {
    auto hr = subscribe_hr();
    if (hr.is_error()) {
      POLARLINK_LOG_ERROR(LOG_MODULE, "Failed to restore heart rate monitoring: "
                                          << hr.error().message);
      {
        std::lock_guard<std::mutex> lock(mutex);
        hr_active = false;
        hr_cb = nullptr;
      }
      emit_error(hr.error());
    }
  }

  if (restore_ecg) {
    auto ecg = start_ecg();
    if (ecg.is_error()) {
      POLARLINK_LOG_ERROR(LOG_MODULE, "Failed to restore ECG streaming: "
                                          << ecg.error().message);
      {
        std::lock_guard<std::mutex> lock(mutex);
        ecg_active = false;
        ecg_cb = nullptr;
      }
      emit_error(ecg.error());
    }
  }

  POLARLINK_LOG_INFO(LOG_MODULE, "Connection restored");
  return true;
}

// ============================================================================
// PolarH10 Public API
// ============================================================================

PolarH10::PolarH10(std::shared_ptr<GattTransport> transport,
                   PolarDeviceConfig config)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(config))) {
  Impl *impl = impl_.get();
  impl_->link.on_state_changed([impl](ConnectionState from,
                                      ConnectionState to) {
    POLARLINK_LOG_DEBUG(LOG_MODULE, "State " << connection_state_name(from)
                                             << " -> "
                                             << connection_state_name(to));
    std::function<void(ConnectionState)> cb;
    {
      std::lock_guard<std::mutex> lock(impl->mutex);
      cb = impl->state_changed_cb;
    }
    if (cb) {
      cb(to);
    }
  });
}

PolarH10::~PolarH10() {
  auto result = disconnect();
  if (result.is_error()) {
    POLARLINK_LOG_WARN(LOG_MODULE, "Disconnect during shutdown failed: "
                                       << result.error().message);
  }
  impl_->transport->on_disconnected(nullptr);
  impl_->link.on_state_changed(nullptr);
  if (impl_->supervisor.joinable() &&
      impl_->supervisor.get_id() != std::this_thread::get_id()) {
    impl_->supervisor.join();
  }
}

Result<BleDeviceInfo> PolarH10::discover() { return impl_->discover(); }

Result<void> PolarH10::connect(bool retry_on_fail) {
  if (impl_->link.is_connected()) {
    return Error(ErrorCode::AlreadyConnected, "Device already connected");
  }

  const ReconnectPolicy &policy = impl_->config.reconnect;
  Error last_error(ErrorCode::ConnectionFailed, "Connection failed");

  for (int attempt = 1;; ++attempt) {
    auto result = impl_->connect_once();
    if (result.is_ok()) {
      impl_->start_supervisor();
      return Result<void>::ok();
    }

    last_error = result.error();
    POLARLINK_LOG_ERROR(LOG_MODULE,
                        "Connection error: " << last_error.message);

    if (!retry_on_fail || !policy.should_retry(attempt)) {
      if (retry_on_fail) {
        POLARLINK_LOG_ERROR(LOG_MODULE, "Max reconnection attempts reached");
      }
      break;
    }

    auto delay = policy.delay_for_attempt(attempt);
    POLARLINK_LOG_INFO(LOG_MODULE, "Retrying connection in "
                                       << delay.count() / 1000.0
                                       << " seconds...");
    std::this_thread::sleep_for(delay);
  }

  return last_error;
}

Result<void> PolarH10::disconnect() {
  impl_->stop_supervisor();

  ConnectionState state = impl_->link.current();
  if (state == ConnectionState::Disconnected) {
    return Result<void>::ok();
  }

  if (state == ConnectionState::Connected) {
    auto ecg = impl_->stop_ecg();
    if (ecg.is_error()) {
      POLARLINK_LOG_WARN(LOG_MODULE,
                         "Error stopping ECG stream: " << ecg.error().message);
    }

    bool hr_was_active = false;
    {
      std::lock_guard<std::mutex> lock(impl_->mutex);
      hr_was_active = impl_->hr_active;
    }
    if (hr_was_active) {
      auto hr = impl_->transport->stop_notify(HEART_RATE_MEASUREMENT_UUID);
      if (hr.is_error()) {
        POLARLINK_LOG_WARN(LOG_MODULE, "Error stopping heart rate monitoring: "
                                           << hr.error().message);
      }
    }

    POLARLINK_TRY(impl_->link.transition(ConnectionState::Disconnecting));
  }

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->hr_active = false;
    impl_->ecg_active = false;
    impl_->hr_cb = nullptr;
    impl_->ecg_cb = nullptr;
    impl_->watchdog.reset();
  }
  impl_->ecg_stream.reset();

  auto dropped = impl_->transport->disconnect();
  if (dropped.is_error()) {
    POLARLINK_LOG_ERROR(LOG_MODULE, "Error during disconnect: "
                                        << dropped.error().message);
  }

  impl_->link.force_transition(ConnectionState::Disconnected);
  POLARLINK_LOG_INFO(LOG_MODULE, "Disconnected from device");
  return Result<void>::ok();
}

ConnectionState PolarH10::connection_state() const {
  return impl_->link.current();
}

bool PolarH10::is_connected() const { return impl_->link.is_connected(); }

std::optional<BleDeviceInfo> PolarH10::device_info() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->device;
}

const PolarDeviceConfig &PolarH10::config() const { return impl_->config; }

Result<void> PolarH10::start_hr_monitoring(HeartRateCallback callback) {
  if (!impl_->link.is_connected()) {
    return Error(ErrorCode::NotConnected, "Device not connected");
  }

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->hr_cb = std::move(callback);
  }

  auto result = impl_->subscribe_hr();
  if (result.is_error()) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->hr_cb = nullptr;
    return result;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->hr_active = true;
  return Result<void>::ok();
}

Result<void> PolarH10::stop_hr_monitoring() {
  bool was_active = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    was_active = impl_->hr_active;
    impl_->hr_active = false;
    impl_->hr_cb = nullptr;
    if (!impl_->ecg_active) {
      // Nothing left to feed the watchdog
      impl_->watchdog.reset();
    }
  }

  if (!was_active || !impl_->link.is_connected()) {
    return Result<void>::ok();
  }

  POLARLINK_TRY(impl_->transport->stop_notify(HEART_RATE_MEASUREMENT_UUID));
  POLARLINK_LOG_INFO(LOG_MODULE, "Heart rate monitoring stopped");
  return Result<void>::ok();
}

Result<HeartRateMeasurement>
PolarH10::process_heart_rate_data(const Bytes &data) {
  return impl_->process_hr(data);
}

std::optional<int> PolarH10::last_heart_rate() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->last_hr;
}

std::optional<QualityStats> PolarH10::get_quality_stats() const {
  return impl_->quality.get_stats();
}

Result<void> PolarH10::start_ecg_stream(EcgCallback callback) {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->ecg_active) {
      return Error(ErrorCode::StreamAlreadyActive,
                   "ECG stream already active");
    }
    impl_->ecg_cb = std::move(callback);
  }

  auto result = impl_->start_ecg();

  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (result.is_error()) {
    impl_->ecg_cb = nullptr;
    return result;
  }
  impl_->ecg_active = true;
  return Result<void>::ok();
}

Result<void> PolarH10::stop_ecg_stream() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ecg_active = false;
  }

  auto result = impl_->stop_ecg();

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->ecg_cb = nullptr;
  if (!impl_->hr_active) {
    impl_->watchdog.reset();
  }
  return result;
}

bool PolarH10::is_ecg_streaming() const {
  return impl_->ecg_stream.is_streaming();
}

std::vector<EcgSample> PolarH10::recent_ecg_samples(size_t n) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->ecg_buffer.last(n);
}

Result<void> PolarH10::validate_services() const {
  if (!impl_->transport->is_connected()) {
    return Error(ErrorCode::NotConnected, "Device not connected");
  }

  return impl_->check_services();
}

void PolarH10::on_state_changed(std::function<void(ConnectionState)> callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->state_changed_cb = std::move(callback);
}

void PolarH10::on_error(std::function<void(const Error &)> callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->error_cb = std::move(callback);
}

} // namespace polarlink
