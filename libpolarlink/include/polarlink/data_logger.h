/**
 * @file data_logger.h
 * @brief CSV recording of heart rate and ECG data
 *
 * Heart rate files:  <dir>/polar_h10_log_YYYYMMDD_HHMMSS.csv
 *                    Timestamp,HeartRate
 * ECG files:         <dir>/polar_h10_ecg_YYYYMMDD_HHMMSS.csv
 *                    TimestampNs,Microvolts
 */

#ifndef POLARLINK_DATA_LOGGER_H
#define POLARLINK_DATA_LOGGER_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace polarlink {

constexpr const char *HR_LOG_PREFIX = "polar_h10_log";
constexpr const char *ECG_LOG_PREFIX = "polar_h10_ecg";

/// Local time as "YYYY-MM-DDTHH:MM:SS.ffffff"
POLARLINK_API std::string
format_iso_timestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Writes session recordings to CSV files
 *
 * Thread-safe.
 */
class POLARLINK_API DataLogger {
public:
  explicit DataLogger(std::filesystem::path log_dir = "data");
  ~DataLogger();

  // Non-copyable
  DataLogger(const DataLogger &) = delete;
  DataLogger &operator=(const DataLogger &) = delete;

  /**
   * @brief Create the log directory and open a heart rate log
   */
  Result<void> init();

  /**
   * @brief Unused file name for a new log, stamped with the current time
   *
   * A "_N" suffix is added when a file of that name already exists.
   */
  std::filesystem::path
  generate_filename(const std::string &prefix = HR_LOG_PREFIX) const;

  /// Close the current heart rate log and start another
  Result<void> start_new_log();

  Result<void> log_heart_rate(
      int bpm, std::chrono::system_clock::time_point timestamp =
                   std::chrono::system_clock::now());

  Result<void> start_ecg_log();

  Result<void> log_ecg_samples(const std::vector<EcgSample> &samples);

  /// Latest heart rate log, empty before the first one is started
  std::filesystem::path current_file() const;

  /// Latest ECG log, empty before the first one is started
  std::filesystem::path current_ecg_file() const;

  const std::filesystem::path &log_dir() const;

  /// Flush and close all open logs
  void close();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace polarlink

#endif // POLARLINK_DATA_LOGGER_H
