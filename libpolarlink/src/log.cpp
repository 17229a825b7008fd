/**
 * @file log.cpp
 * @brief Logger and sink implementation
 */

#include "polarlink/log.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace polarlink {

// ============================================================================
// Level Names
// ============================================================================

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    return "OFF";
  default:
    return "UNKNOWN";
  }
}

std::optional<LogLevel> parse_log_level(const std::string &s) {
  std::string upper = s;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "TRACE")
    return LogLevel::Trace;
  if (upper == "DEBUG")
    return LogLevel::Debug;
  if (upper == "INFO")
    return LogLevel::Info;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::Warn;
  if (upper == "ERROR")
    return LogLevel::Error;
  if (upper == "OFF")
    return LogLevel::Off;
  return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_log_record(const LogRecord &record) {
  using namespace std::chrono;

  std::time_t t = system_clock::to_time_t(record.timestamp);
  auto ms = duration_cast<milliseconds>(record.timestamp.time_since_epoch()) %
            1000;

  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3)
      << std::setfill('0') << ms.count() << " - " << record.module << " - "
      << log_level_name(record.level) << " - " << record.message;
  return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::write(const LogRecord &record) {
  std::cerr << format_log_record(record) << '\n';
}

void ConsoleSink::flush() { std::cerr.flush(); }

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string &path)
    : file_(path, std::ios::out | std::ios::app) {}

void FileSink::write(const LogRecord &record) {
  if (!file_.is_open()) {
    return;
  }

  file_ << format_log_record(record) << '\n';
  if (record.level >= LogLevel::Warn) {
    file_.flush();
  }
}

void FileSink::flush() {
  if (file_.is_open()) {
    file_.flush();
  }
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() { sinks_.push_back(std::make_shared<ConsoleSink>()); }

Logger &Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::set_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::should_log(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level != LogLevel::Off && level >= level_ && !sinks_.empty();
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
  if (!sink) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.clear();
}

void Logger::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = LogLevel::Info;
  sinks_.clear();
  sinks_.push_back(std::make_shared<ConsoleSink>());
}

void Logger::log(LogLevel level, const std::string &module,
                 const std::string &message, const char *file, int line) {
  LogRecord record;
  record.level = level;
  record.module = module;
  record.message = message;
  record.file = file;
  record.line = line;
  record.timestamp = std::chrono::system_clock::now();

  std::lock_guard<std::mutex> lock(mutex_);
  if (level == LogLevel::Off || level < level_) {
    return;
  }
  for (const auto &sink : sinks_) {
    sink->write(record);
  }
}

void Logger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &sink : sinks_) {
    sink->flush();
  }
}

} // namespace polarlink
