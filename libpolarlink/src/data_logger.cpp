/**
 * @file data_logger.cpp
 * @brief CSV recording implementation
 */

#include "polarlink/data_logger.h"
#include "polarlink/log.h"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace fs = ::std::filesystem;

namespace polarlink {

namespace {

constexpr const char *LOG_MODULE = "data_logger";

std::tm local_time(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

Result<void> open_csv(std::ofstream &file, const fs::path &path,
                      const char *header) {
  file.close();
  file.clear();
  file.open(path, std::ios::out | std::ios::trunc);
  if (!file) {
    return Error(ErrorCode::FileWriteError,
                 "Failed to initialize CSV file: " + path.string());
  }

  file << header << "\n";
  file.flush();
  if (!file) {
    return Error(ErrorCode::FileWriteError,
                 "Failed to write CSV header: " + path.string());
  }
  return Result<void>::ok();
}

} // namespace

std::string format_iso_timestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;

  auto since_epoch = tp.time_since_epoch();
  auto secs = duration_cast<seconds>(since_epoch);
  auto micros = duration_cast<microseconds>(since_epoch - secs).count();
  if (micros < 0) {
    micros += 1000000;
    secs -= seconds(1);
  }

  std::tm tm = local_time(static_cast<std::time_t>(secs.count()));

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
      << std::setfill('0') << micros;
  return out.str();
}

// ============================================================================
// DataLogger Implementation
// ============================================================================

class DataLogger::Impl {
public:
  explicit Impl(fs::path dir) : log_dir(std::move(dir)) {}

  fs::path log_dir;
  mutable std::mutex mutex;

  fs::path hr_path;
  std::ofstream hr_file;

  fs::path ecg_path;
  std::ofstream ecg_file;

  fs::path unused_name(const std::string &prefix) const;
  Result<void> ensure_dir() const;
};

fs::path DataLogger::Impl::unused_name(const std::string &prefix) const {
  std::tm tm = local_time(std::time(nullptr));
  std::ostringstream stem;
  stem << prefix << '_' << std::put_time(&tm, "%Y%m%d_%H%M%S");

  fs::path candidate = log_dir / (stem.str() + ".csv");
  std::error_code ec;
  for (int n = 1; fs::exists(candidate, ec); ++n) {
    candidate = log_dir / (stem.str() + "_" + std::to_string(n) + ".csv");
  }
  return candidate;
}

Result<void> DataLogger::Impl::ensure_dir() const {
  std::error_code ec;
  fs::create_directories(log_dir, ec);
  if (ec) {
    return Error(ErrorCode::DirectoryCreateFailed,
                 "Cannot create log directory " + log_dir.string(),
                 ec.message());
  }
  return Result<void>::ok();
}

DataLogger::DataLogger(fs::path log_dir)
    : impl_(std::make_unique<Impl>(std::move(log_dir))) {}

DataLogger::~DataLogger() { close(); }

Result<void> DataLogger::init() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    POLARLINK_TRY(impl_->ensure_dir());
  }
  return start_new_log();
}

fs::path DataLogger::generate_filename(const std::string &prefix) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->unused_name(prefix);
}

Result<void> DataLogger::start_new_log() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  POLARLINK_TRY(impl_->ensure_dir());

  fs::path path = impl_->unused_name(HR_LOG_PREFIX);
  auto opened = open_csv(impl_->hr_file, path, "Timestamp,HeartRate");
  if (opened.is_error()) {
    impl_->hr_path.clear();
    return opened;
  }

  impl_->hr_path = path;
  POLARLINK_LOG_INFO(LOG_MODULE, "Recording heart rate to " << path.string());
  return Result<void>::ok();
}

Result<void>
DataLogger::log_heart_rate(int bpm,
                           std::chrono::system_clock::time_point timestamp) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->hr_file.is_open()) {
    return Error(ErrorCode::NotInitialized, "No heart rate log open");
  }

  impl_->hr_file << format_iso_timestamp(timestamp) << ',' << bpm << "\n";
  impl_->hr_file.flush();
  if (!impl_->hr_file) {
    return Error(ErrorCode::FileWriteError,
                 "Failed to log heart rate data: " + impl_->hr_path.string());
  }
  return Result<void>::ok();
}

Result<void> DataLogger::start_ecg_log() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  POLARLINK_TRY(impl_->ensure_dir());

  fs::path path = impl_->unused_name(ECG_LOG_PREFIX);
  auto opened = open_csv(impl_->ecg_file, path, "TimestampNs,Microvolts");
  if (opened.is_error()) {
    impl_->ecg_path.clear();
    return opened;
  }

  impl_->ecg_path = path;
  POLARLINK_LOG_INFO(LOG_MODULE, "Recording ECG to " << path.string());
  return Result<void>::ok();
}

Result<void>
DataLogger::log_ecg_samples(const std::vector<EcgSample> &samples) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->ecg_file.is_open()) {
    return Error(ErrorCode::NotInitialized, "No ECG log open");
  }

  for (const auto &s : samples) {
    impl_->ecg_file << s.timestamp_ns << ',' << s.microvolts << "\n";
  }
  impl_->ecg_file.flush();
  if (!impl_->ecg_file) {
    return Error(ErrorCode::FileWriteError,
                 "Failed to log ECG data: " + impl_->ecg_path.string());
  }
  return Result<void>::ok();
}

fs::path DataLogger::current_file() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->hr_path;
}

fs::path DataLogger::current_ecg_file() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->ecg_path;
}

const fs::path &DataLogger::log_dir() const { return impl_->log_dir; }

void DataLogger::close() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->hr_file.is_open()) {
    impl_->hr_file.close();
  }
  if (impl_->ecg_file.is_open()) {
    impl_->ecg_file.close();
  }
}

} // namespace polarlink
