/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

// Standard library includes FIRST, before any project headers
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>

#include <pwd.h>
#include <unistd.h>

// Project includes LAST
#include "polarlink/config.h"

namespace fs = ::std::filesystem;

namespace polarlink {

namespace {

constexpr const char *LOG_MODULE = "config";
constexpr const char *CONFIG_FILE_NAME = "polarlink.conf";

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool parse_bool(const std::string &value, bool &out) {
  const std::string v = to_lower(value);
  if (v == "true" || v == "yes" || v == "on" || v == "1") {
    out = true;
    return true;
  }
  if (v == "false" || v == "no" || v == "off" || v == "0") {
    out = false;
    return true;
  }
  return false;
}

bool parse_int(const std::string &value, long long &out) {
  if (value.empty()) {
    return false;
  }
  char *end = nullptr;
  long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (end == nullptr || *end != '\0') {
    return false;
  }
  out = parsed;
  return true;
}

Error parse_error(int line_no, const std::string &line,
                  const std::string &reason) {
  return Error(ErrorCode::ConfigParseError,
               "Line " + std::to_string(line_no) + ": " + reason, line);
}

} // namespace

// ============================================================================
// MonitorConfig Methods
// ============================================================================

void MonitorConfig::load_defaults() { *this = MonitorConfig(); }

Result<void> MonitorConfig::validate() const {
  if (device_address.empty() && name_filter.empty()) {
    return Error(ErrorCode::ConfigInvalid,
                 "Either a device address or a name filter is required");
  }

  if (!device_address.empty() && !is_valid_ble_address(device_address)) {
    return Error(ErrorCode::ConfigInvalid,
                 "Invalid device address: " + device_address);
  }

  if (max_reconnect_attempts < 1) {
    return Error(ErrorCode::ConfigInvalid,
                 "max_reconnect_attempts must be at least 1");
  }

  if (scan_timeout.count() <= 0 || connect_timeout.count() <= 0 ||
      data_timeout.count() <= 0) {
    return Error(ErrorCode::ConfigInvalid, "Timeouts must be positive");
  }

  if (base_retry_interval.count() <= 0 || max_retry_interval.count() <= 0) {
    return Error(ErrorCode::ConfigInvalid, "Retry intervals must be positive");
  }

  if (quality_buffer_size == 0 || display_points == 0) {
    return Error(ErrorCode::ConfigInvalid, "Buffer sizes must be positive");
  }

  // The H10 only streams ECG at 130 Hz / 14 bit
  if (ecg_sample_rate != 130) {
    return Error(ErrorCode::ConfigInvalid,
                 "Unsupported ECG sample rate: " +
                     std::to_string(ecg_sample_rate));
  }
  if (ecg_resolution != 14) {
    return Error(ErrorCode::ConfigInvalid,
                 "Unsupported ECG resolution: " +
                     std::to_string(ecg_resolution));
  }

  if (log_dir.empty()) {
    return Error(ErrorCode::ConfigInvalid, "log_dir must not be empty");
  }

  return Result<void>::ok();
}

PolarDeviceConfig MonitorConfig::to_device_config() const {
  PolarDeviceConfig dc;
  dc.device_address = device_address;
  dc.name_filter = name_filter;
  dc.scan_timeout = scan_timeout;
  dc.connect_timeout = connect_timeout;
  dc.reconnect.max_attempts = max_reconnect_attempts;
  dc.reconnect.base_interval = base_retry_interval;
  dc.reconnect.max_interval = max_retry_interval;
  dc.data_timeout = data_timeout;
  dc.quality_buffer_size = quality_buffer_size;
  dc.ecg.sample_rate_hz = ecg_sample_rate;
  dc.ecg.resolution_bits = ecg_resolution;
  dc.ecg_buffer_capacity = static_cast<size_t>(ecg_sample_rate) * 10;
  dc.auto_reconnect = auto_reconnect;
  return dc;
}

fs::path MonitorConfig::get_default_config_dir() {
  // Linux: Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "polarlink";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "polarlink";
  }

  return fs::path("/tmp/polarlink");
}

// ============================================================================
// File Format
// ============================================================================

Result<void> parse_config(std::istream &in, MonitorConfig &config) {
  std::string raw;
  int line_no = 0;

  while (std::getline(in, raw)) {
    ++line_no;
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      return parse_error(line_no, raw, "expected 'key = value'");
    }

    const std::string key = to_lower(trim(line.substr(0, eq)));
    const std::string value = trim(line.substr(eq + 1));
    long long number = 0;
    bool flag = false;

    if (key == "device_address") {
      config.device_address = value;
    } else if (key == "name_filter") {
      config.name_filter = value;
    } else if (key == "mode") {
      auto mode = parse_monitor_mode(value);
      if (!mode) {
        return parse_error(line_no, raw, "mode must be HR or ECG");
      }
      config.mode = *mode;
    } else if (key == "log_level") {
      auto level = parse_log_level(value);
      if (!level) {
        return parse_error(line_no, raw, "unknown log level '" + value + "'");
      }
      config.log_level = *level;
    } else if (key == "log_dir") {
      config.log_dir = value;
    } else if (key == "record_csv" || key == "auto_reconnect") {
      if (!parse_bool(value, flag)) {
        return parse_error(line_no, raw, key + " must be true or false");
      }
      (key == "record_csv" ? config.record_csv : config.auto_reconnect) = flag;
    } else if (key == "scan_timeout" || key == "connect_timeout" ||
               key == "max_reconnect_attempts" ||
               key == "base_retry_interval_ms" ||
               key == "max_retry_interval" || key == "data_timeout" ||
               key == "quality_buffer_size" || key == "display_points" ||
               key == "ecg_sample_rate" || key == "ecg_resolution") {
      if (!parse_int(value, number) || number < 0) {
        return parse_error(line_no, raw,
                           key + " must be a non-negative integer");
      }

      // Seconds fit in milliseconds at this bound
      long long limit = std::numeric_limits<int>::max();
      if (key == "ecg_sample_rate" || key == "ecg_resolution") {
        limit = std::numeric_limits<uint16_t>::max();
      }
      if (number > limit) {
        return parse_error(line_no, raw,
                           key + " is out of range (max " +
                               std::to_string(limit) + ")");
      }

      if (key == "scan_timeout") {
        config.scan_timeout = std::chrono::seconds(number);
      } else if (key == "connect_timeout") {
        config.connect_timeout = std::chrono::seconds(number);
      } else if (key == "max_reconnect_attempts") {
        config.max_reconnect_attempts = static_cast<int>(number);
      } else if (key == "base_retry_interval_ms") {
        config.base_retry_interval = std::chrono::milliseconds(number);
      } else if (key == "max_retry_interval") {
        config.max_retry_interval = std::chrono::seconds(number);
      } else if (key == "data_timeout") {
        config.data_timeout = std::chrono::seconds(number);
      } else if (key == "quality_buffer_size") {
        config.quality_buffer_size = static_cast<size_t>(number);
      } else if (key == "display_points") {
        config.display_points = static_cast<size_t>(number);
      } else if (key == "ecg_sample_rate") {
        config.ecg_sample_rate = static_cast<uint16_t>(number);
      } else {
        config.ecg_resolution = static_cast<uint16_t>(number);
      }
    } else {
      POLARLINK_LOG_WARN(LOG_MODULE, "Ignoring unknown key '"
                                         << key << "' on line " << line_no);
    }
  }

  return Result<void>::ok();
}

std::string format_config(const MonitorConfig &config) {
  std::ostringstream out;
  out << "# PolarLink configuration\n";
  out << "device_address = " << config.device_address << "\n";
  out << "name_filter = " << config.name_filter << "\n";
  out << "mode = " << monitor_mode_name(config.mode) << "\n";
  out << "log_level = " << log_level_name(config.log_level) << "\n";
  out << "log_dir = " << config.log_dir.string() << "\n";
  out << "record_csv = " << (config.record_csv ? "true" : "false") << "\n";
  out << "scan_timeout = " << config.scan_timeout.count() << "\n";
  out << "connect_timeout = " << config.connect_timeout.count() << "\n";
  out << "max_reconnect_attempts = " << config.max_reconnect_attempts << "\n";
  out << "base_retry_interval_ms = " << config.base_retry_interval.count()
      << "\n";
  out << "max_retry_interval = " << config.max_retry_interval.count() << "\n";
  out << "data_timeout = " << config.data_timeout.count() << "\n";
  out << "auto_reconnect = " << (config.auto_reconnect ? "true" : "false")
      << "\n";
  out << "quality_buffer_size = " << config.quality_buffer_size << "\n";
  out << "display_points = " << config.display_points << "\n";
  out << "ecg_sample_rate = " << config.ecg_sample_rate << "\n";
  out << "ecg_resolution = " << config.ecg_resolution << "\n";
  return out.str();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  MonitorConfig config;
  fs::path config_path;
  mutable std::mutex mutex;
  bool initialized = false;

  Result<void> load_locked();
  Result<void> save_locked() const;
};

Result<void> ConfigManager::Impl::load_locked() {
  std::ifstream file(config_path);
  if (!file) {
    return Error(ErrorCode::FileReadError,
                 "Cannot open config file: " + config_path.string());
  }

  MonitorConfig loaded;
  auto parsed = parse_config(file, loaded);
  if (parsed.is_error()) {
    parsed.error().details = config_path.string();
    return parsed;
  }

  POLARLINK_TRY(loaded.validate());

  config = loaded;
  POLARLINK_LOG_DEBUG(LOG_MODULE, "Loaded " << config_path.string());
  return Result<void>::ok();
}

Result<void> ConfigManager::Impl::save_locked() const {
  auto dir = config_path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::DirectoryCreateFailed,
                   "Cannot create " + dir.string(), ec.message());
    }
  }

  std::ofstream file(config_path, std::ios::trunc);
  if (!file) {
    return Error(ErrorCode::FileWriteError,
                 "Cannot write config file: " + config_path.string());
  }

  file << format_config(config);
  if (!file) {
    return Error(ErrorCode::FileWriteError,
                 "Write failed: " + config_path.string());
  }
  return Result<void>::ok();
}

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
  impl_->config_path =
      MonitorConfig::get_default_config_dir() / CONFIG_FILE_NAME;
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (config_path.empty()) {
    impl_->config_path =
        MonitorConfig::get_default_config_dir() / CONFIG_FILE_NAME;
  } else {
    impl_->config_path = config_path;
  }

  impl_->initialized = true;

  std::error_code ec;
  if (!fs::exists(impl_->config_path, ec)) {
    POLARLINK_LOG_DEBUG(LOG_MODULE, "No config file at "
                                        << impl_->config_path.string()
                                        << ", using defaults");
    return Result<void>::ok();
  }

  return impl_->load_locked();
}

const MonitorConfig &ConfigManager::get() const { return impl_->config; }

Result<void> ConfigManager::set(const MonitorConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->save_locked();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

const fs::path &ConfigManager::config_path() const {
  return impl_->config_path;
}

} // namespace polarlink
