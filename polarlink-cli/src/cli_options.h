/**
 * @file cli_options.h
 * @brief Command line parsing for the polarlink tool
 */

#ifndef POLARLINK_CLI_OPTIONS_H
#define POLARLINK_CLI_OPTIONS_H

#include <polarlink/config.h>
#include <polarlink/error.h>
#include <polarlink/log.h>
#include <polarlink/types.h>
#include <filesystem>
#include <optional>
#include <string>

namespace polarlink {
namespace cli {

/// Exit status for bad command lines
constexpr int EXIT_USAGE = 2;

/**
 * @brief Parsed command line
 *
 * Unset optionals leave the configuration file's value in place.
 */
struct CliOptions {
  bool show_help = false;
  bool show_version = false;
  bool scan_only = false;
  bool no_record = false;

  std::optional<MonitorMode> mode;
  std::optional<LogLevel> log_level;
  std::optional<std::string> device_address;
  std::optional<std::filesystem::path> log_dir;
  std::optional<std::filesystem::path> config_path;
  std::optional<int> scan_timeout_s;

  /// Overlay the options that were given onto a configuration
  void apply_to(MonitorConfig &config) const;
};

/**
 * @brief Parse argv
 *
 * Accepts "--opt value" and "--opt=value".
 * @return InvalidArgument describing the first bad argument
 */
Result<CliOptions> parse_cli_options(int argc, const char *const argv[]);

std::string usage_text(const std::string &program);

} // namespace cli
} // namespace polarlink

#endif // POLARLINK_CLI_OPTIONS_H
