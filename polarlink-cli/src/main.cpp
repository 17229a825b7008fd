/**
 * @file main.cpp
 * @brief polarlink command line monitor
 *
 * Scans for BLE devices or connects to a Polar H10 and streams heart
 * rate or ECG until interrupted.
 */

#include "cli_options.h"
#include <polarlink/polarlink.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <signal.h>

namespace {

constexpr const char *LOG_MODULE = "main";

/// Outer connection attempts, each running the device's own retries
constexpr int CONNECT_ATTEMPTS = 3;
constexpr auto CONNECT_ATTEMPT_GAP = std::chrono::seconds(2);

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) { g_stop_requested = 1; }

void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_signal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

/// Sleep in small steps so a signal ends the wait promptly
bool sleep_unless_stopped(std::chrono::milliseconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (!g_stop_requested && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return !g_stop_requested;
}

// ============================================================================
// Scan
// ============================================================================

int run_scan(polarlink::GattTransport &transport,
             const polarlink::MonitorConfig &config) {
  std::cout << "Scanning for BLE devices..." << std::endl;

  auto devices = transport.scan(config.scan_timeout);
  if (devices.is_error()) {
    std::cerr << "Bluetooth error: " << devices.error().to_string() << "\n";
    std::cerr << "Please ensure Bluetooth is enabled and permissions are "
                 "granted."
              << std::endl;
    return 1;
  }

  if (devices.value().empty()) {
    std::cout << "No BLE devices found!" << std::endl;
    return 0;
  }

  std::cout << "\nFound devices:\n";
  for (const auto &d : devices.value()) {
    std::cout << "Name: " << (d.name.empty() ? "Unknown" : d.name) << "\n";
    std::cout << "Address: " << d.address << "\n";
    std::cout << "RSSI: " << d.rssi_dbm << "dBm\n";
    if (!d.service_uuids.empty()) {
      std::cout << "Services:";
      for (const auto &uuid : d.service_uuids) {
        std::cout << " " << uuid;
      }
      std::cout << "\n";
    }
    std::cout << std::string(50, '-') << "\n";
  }
  std::cout.flush();
  return 0;
}

// ============================================================================
// Monitor
// ============================================================================

polarlink::Result<void> connect_with_retries(polarlink::PolarH10 &device) {
  polarlink::Result<void> result =
      polarlink::Error(polarlink::ErrorCode::Cancelled, "Interrupted");

  for (int attempt = 1; attempt <= CONNECT_ATTEMPTS && !g_stop_requested;
       ++attempt) {
    result = device.connect();
    if (result.is_ok() || attempt == CONNECT_ATTEMPTS) {
      break;
    }

    POLARLINK_LOG_WARN(LOG_MODULE, "Connection attempt "
                                       << attempt << " failed: "
                                       << result.error().message
                                       << ". Retrying...");
    if (!sleep_unless_stopped(CONNECT_ATTEMPT_GAP)) {
      return polarlink::Error(polarlink::ErrorCode::Cancelled, "Interrupted");
    }
  }

  return result;
}

int run_monitor(std::shared_ptr<polarlink::GattTransport> transport,
                const polarlink::MonitorConfig &config) {
  using namespace polarlink;

  std::unique_ptr<DataLogger> recorder;
  if (config.record_csv) {
    recorder = std::make_unique<DataLogger>(config.log_dir);
    auto started = config.mode == MonitorMode::HeartRate
                       ? recorder->init()
                       : recorder->start_ecg_log();
    if (started.is_error()) {
      POLARLINK_LOG_ERROR(LOG_MODULE, started.error().to_string());
      return 1;
    }
  }

  // ECG samples arrive 130 per second; they are batched for the CSV
  std::mutex pending_mutex;
  std::vector<EcgSample> pending;

  PolarH10 device(std::move(transport), config.to_device_config());

  device.on_error([](const Error &err) {
    POLARLINK_LOG_ERROR(LOG_MODULE, err.to_string());
  });

  POLARLINK_LOG_INFO(LOG_MODULE, "Attempting to connect to Polar H10...");
  auto connected = connect_with_retries(device);
  if (connected.is_error()) {
    if (connected.error().code == ErrorCode::Cancelled) {
      POLARLINK_LOG_INFO(LOG_MODULE, "Shutting down...");
      return 0;
    }
    POLARLINK_LOG_ERROR(LOG_MODULE, "Could not connect: "
                                        << connected.error().to_string());
    return 1;
  }
  POLARLINK_LOG_INFO(LOG_MODULE, "Successfully connected to Polar H10");

  Result<void> started;
  if (config.mode == MonitorMode::HeartRate) {
    DataLogger *rec = recorder.get();
    started = device.start_hr_monitoring([rec](const HeartRateReading &r) {
      std::cout << "Heart Rate: " << r.measurement.bpm << " BPM" << std::endl;
      if (rec) {
        auto logged = rec->log_heart_rate(r.measurement.bpm, r.timestamp);
        if (logged.is_error()) {
          POLARLINK_LOG_WARN(LOG_MODULE, logged.error().message);
        }
      }
    });
  } else {
    started = device.start_ecg_stream([&](const EcgSample &s) {
      std::lock_guard<std::mutex> lock(pending_mutex);
      pending.push_back(s);
    });
  }

  if (started.is_error()) {
    POLARLINK_LOG_ERROR(LOG_MODULE, "Failed to start "
                                        << monitor_mode_name(config.mode)
                                        << " monitoring: "
                                        << started.error().to_string());
    auto dropped = device.disconnect();
    if (dropped.is_error()) {
      POLARLINK_LOG_WARN(LOG_MODULE, dropped.error().message);
    }
    return 1;
  }

  while (sleep_unless_stopped(std::chrono::seconds(1))) {
    if (config.mode != MonitorMode::Ecg) {
      continue;
    }

    std::vector<EcgSample> batch;
    {
      std::lock_guard<std::mutex> lock(pending_mutex);
      batch.swap(pending);
    }

    if (batch.empty()) {
      std::cout << "ECG: waiting for data (" << connection_state_name(
                                                   device.connection_state())
                << ")" << std::endl;
      continue;
    }

    std::cout << "ECG: " << batch.size() << " samples, last "
              << batch.back().microvolts << " uV" << std::endl;
    if (recorder) {
      auto logged = recorder->log_ecg_samples(batch);
      if (logged.is_error()) {
        POLARLINK_LOG_WARN(LOG_MODULE, logged.error().message);
      }
    }
  }

  POLARLINK_LOG_INFO(LOG_MODULE, "Shutting down...");
  auto stopped = device.disconnect();
  if (stopped.is_error()) {
    POLARLINK_LOG_ERROR(LOG_MODULE, stopped.error().to_string());
  }

  if (recorder) {
    // The stream is down, so whatever is pending is final
    std::lock_guard<std::mutex> lock(pending_mutex);
    if (!pending.empty()) {
      auto logged = recorder->log_ecg_samples(pending);
      if (logged.is_error()) {
        POLARLINK_LOG_WARN(LOG_MODULE, logged.error().message);
      }
    }
    recorder->close();
  }

  return stopped.is_ok() ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace polarlink;

  auto parsed = cli::parse_cli_options(argc, argv);
  if (parsed.is_error()) {
    std::cerr << "polarlink: " << parsed.error().message << "\n\n"
              << cli::usage_text(argv[0]);
    return cli::EXIT_USAGE;
  }
  const cli::CliOptions &opts = parsed.value();

  if (opts.show_help) {
    std::cout << cli::usage_text(argv[0]);
    return 0;
  }

  if (opts.show_version) {
    VersionInfo v = get_version();
    std::cout << "polarlink " << v.version_string << " (Bluetooth backend: "
              << (v.bluetooth_backend ? "BlueZ" : "none") << ")" << std::endl;
    return 0;
  }

  ConfigManager config_manager;
  auto loaded = config_manager.init(opts.config_path.value_or(
      std::filesystem::path()));
  if (loaded.is_error()) {
    std::cerr << "polarlink: " << loaded.error().to_string() << std::endl;
    return 1;
  }

  MonitorConfig config = config_manager.get();
  opts.apply_to(config);

  auto valid = config.validate();
  if (valid.is_error()) {
    std::cerr << "polarlink: " << valid.error().to_string() << std::endl;
    return cli::EXIT_USAGE;
  }

  Logger::instance().set_level(config.log_level);
  install_signal_handlers();

  auto transport = create_default_transport();
  if (transport.is_error()) {
    POLARLINK_LOG_ERROR(LOG_MODULE, transport.error().to_string());
    return 1;
  }
  std::shared_ptr<GattTransport> shared_transport =
      std::move(transport.value());

  int status = opts.scan_only ? run_scan(*shared_transport, config)
                              : run_monitor(shared_transport, config);

  Logger::instance().flush();
  return status;
}
