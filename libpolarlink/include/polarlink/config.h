/**
 * @file config.h
 * @brief Monitor configuration for PolarLink
 *
 * Settings are stored as "key = value" lines. Lines starting with '#'
 * are comments. Durations are whole seconds unless the key ends in _ms.
 */

#ifndef POLARLINK_CONFIG_H
#define POLARLINK_CONFIG_H

#include "error.h"
#include "log.h"
#include "platform.h"
#include "polar_device.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

namespace polarlink {

// ============================================================================
// Monitor Configuration
// ============================================================================

/**
 * @brief Complete configuration for a monitoring session
 */
struct POLARLINK_API MonitorConfig {
  // ========================================================================
  // Device
  // ========================================================================

  /// Empty = discover by name
  std::string device_address;

  std::string name_filter = "Polar H10";

  MonitorMode mode = MonitorMode::HeartRate;

  // ========================================================================
  // Logging and Recording
  // ========================================================================

  LogLevel log_level = LogLevel::Info;

  /// Directory for CSV recordings
  std::filesystem::path log_dir = "data";

  bool record_csv = true;

  // ========================================================================
  // Connection
  // ========================================================================

  std::chrono::seconds scan_timeout{10};
  std::chrono::seconds connect_timeout{20};
  int max_reconnect_attempts = 5;
  std::chrono::milliseconds base_retry_interval{1000};
  std::chrono::seconds max_retry_interval{60};
  std::chrono::seconds data_timeout{5};
  bool auto_reconnect = true;

  // ========================================================================
  // Data
  // ========================================================================

  size_t quality_buffer_size = 60;

  /// Points kept by the live plot
  size_t display_points = 100;

  uint16_t ecg_sample_rate = 130;
  uint16_t ecg_resolution = 14;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Load default values
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Settings for the device layer
  PolarDeviceConfig to_device_config() const;

  /// $XDG_CONFIG_HOME/polarlink, else ~/.config/polarlink
  static std::filesystem::path get_default_config_dir();
};

/**
 * @brief Apply "key = value" lines to a configuration
 *
 * Unknown keys are logged and skipped. The result is not validated.
 * @return ConfigParseError naming the offending line
 */
POLARLINK_API Result<void> parse_config(std::istream &in,
                                        MonitorConfig &config);

/// Render every key in the file format parse_config() reads
POLARLINK_API std::string format_config(const MonitorConfig &config);

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 */
class POLARLINK_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  /**
   * @brief Initialize with config file path
   * @param config_path Path to config file; empty selects the default
   * @return Error if an existing file cannot be loaded
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  const MonitorConfig &get() const;

  /// Validate and replace the configuration
  Result<void> set(const MonitorConfig &config);

  /// Reload from the file; the current settings survive a failed load
  Result<void> load();

  Result<void> save();

  void reset_defaults();

  const std::filesystem::path &config_path() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace polarlink

#endif // POLARLINK_CONFIG_H
