/**
 * @file cli_options.cpp
 * @brief Command line parsing implementation
 */

#include "cli_options.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace polarlink {
namespace cli {

namespace {

/// The levels offered on the command line; config files accept more
std::optional<LogLevel> parse_cli_log_level(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (value != "DEBUG" && value != "INFO" && value != "WARNING" &&
      value != "ERROR") {
    return std::nullopt;
  }
  return parse_log_level(value);
}

} // namespace

void CliOptions::apply_to(MonitorConfig &config) const {
  if (mode) {
    config.mode = *mode;
  }
  if (log_level) {
    config.log_level = *log_level;
  }
  if (device_address) {
    config.device_address = *device_address;
  }
  if (log_dir) {
    config.log_dir = *log_dir;
  }
  if (scan_timeout_s) {
    config.scan_timeout = std::chrono::seconds(*scan_timeout_s);
  }
  if (no_record) {
    config.record_csv = false;
  }
}

Result<CliOptions> parse_cli_options(int argc, const char *const argv[]) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::optional<std::string> inline_value;

    auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
    }

    // Fetch the option's value from "=value" or the next argument
    auto take_value = [&](std::string &out) -> Result<void> {
      if (inline_value) {
        out = *inline_value;
        return Result<void>::ok();
      }
      if (i + 1 >= argc) {
        return Error(ErrorCode::InvalidArgument,
                     "Option " + arg + " requires a value");
      }
      out = argv[++i];
      return Result<void>::ok();
    };

    std::string value;

    if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
    } else if (arg == "--version" || arg == "-V") {
      opts.show_version = true;
    } else if (arg == "--scan") {
      opts.scan_only = true;
    } else if (arg == "--no-record") {
      opts.no_record = true;
    } else if (arg == "--mode") {
      POLARLINK_TRY(take_value(value));
      opts.mode = parse_monitor_mode(value);
      if (!opts.mode) {
        return Error(ErrorCode::InvalidArgument,
                     "Invalid mode '" + value + "' (choose HR or ECG)");
      }
    } else if (arg == "--log-level") {
      POLARLINK_TRY(take_value(value));
      opts.log_level = parse_cli_log_level(value);
      if (!opts.log_level) {
        return Error(ErrorCode::InvalidArgument,
                     "Invalid log level '" + value +
                         "' (choose DEBUG, INFO, WARNING or ERROR)");
      }
    } else if (arg == "--device") {
      POLARLINK_TRY(take_value(value));
      if (!is_valid_ble_address(value)) {
        return Error(ErrorCode::InvalidArgument,
                     "Invalid device address '" + value + "'");
      }
      opts.device_address = value;
    } else if (arg == "--log-dir") {
      POLARLINK_TRY(take_value(value));
      opts.log_dir = value;
    } else if (arg == "--config") {
      POLARLINK_TRY(take_value(value));
      opts.config_path = value;
    } else if (arg == "--scan-timeout") {
      POLARLINK_TRY(take_value(value));
      char *end = nullptr;
      long seconds = std::strtol(value.c_str(), &end, 10);
      if (value.empty() || *end != '\0' || seconds <= 0 || seconds > 600) {
        return Error(ErrorCode::InvalidArgument,
                     "Invalid scan timeout '" + value + "'");
      }
      opts.scan_timeout_s = static_cast<int>(seconds);
    } else {
      return Error(ErrorCode::InvalidArgument, "Unknown option: " + arg);
    }
  }

  return opts;
}

std::string usage_text(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "\n"
      << "Polar H10 Monitor\n"
      << "\n"
      << "Options:\n"
      << "  --mode HR|ECG          Monitoring mode (default: HR)\n"
      << "  --log-level LEVEL      DEBUG, INFO, WARNING or ERROR "
         "(default: INFO)\n"
      << "  --device ADDR          Connect to this address instead of "
         "scanning\n"
      << "  --log-dir DIR          Directory for CSV recordings "
         "(default: data)\n"
      << "  --config FILE          Configuration file\n"
      << "  --no-record            Do not write CSV files\n"
      << "  --scan                 List nearby BLE devices and exit\n"
      << "  --scan-timeout SEC     Scan duration in seconds (default: 10)\n"
      << "  --help, -h             Show this help\n"
      << "  --version, -V          Show version information\n";
  return out.str();
}

} // namespace cli
} // namespace polarlink
