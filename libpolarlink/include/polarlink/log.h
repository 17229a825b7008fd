/**
 * @file log.h
 * @brief Module-tagged logging for PolarLink
 *
 * Records carry a module tag ("device", "bluez", "pmd", ...) and go to
 * every registered sink. The default sink writes to stderr:
 *
 *   2024-05-01 12:00:00,123 - device - INFO - Connected to Polar H10 ABCD
 *
 * Usage:
 * @code
 *   POLARLINK_LOG_INFO("device", "Connected to " << info.name);
 *   POLARLINK_LOG_WARN("device", "Invalid heart rate data: " << err.message);
 * @endcode
 */

#ifndef POLARLINK_LOG_H
#define POLARLINK_LOG_H

#include "platform.h"
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace polarlink {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Off = 5
};

/// "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "OFF"
POLARLINK_API const char *log_level_name(LogLevel level);

/// Parses a level name (case-insensitive, "WARN" and "WARNING" both accepted)
POLARLINK_API std::optional<LogLevel> parse_log_level(const std::string &s);

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
  LogLevel level = LogLevel::Info;
  std::string module;
  std::string message;
  const char *file = nullptr;
  int line = 0;
  std::chrono::system_clock::time_point timestamp;
};

/// Renders a record in the standard text layout
POLARLINK_API std::string format_log_record(const LogRecord &record);

// ============================================================================
// Log Sinks
// ============================================================================

/**
 * @brief Destination for log records
 */
class POLARLINK_API LogSink {
public:
  virtual ~LogSink() = default;
  virtual void write(const LogRecord &record) = 0;
  virtual void flush() {}
};

/// Writes formatted records to stderr
class POLARLINK_API ConsoleSink : public LogSink {
public:
  void write(const LogRecord &record) override;
  void flush() override;
};

/// Appends formatted records to a file, flushing on Warn and above
class POLARLINK_API FileSink : public LogSink {
public:
  explicit FileSink(const std::string &path);

  bool is_open() const { return file_.is_open(); }

  void write(const LogRecord &record) override;
  void flush() override;

private:
  std::ofstream file_;
};

/// Hands each record to a function (UI consoles, tests)
class POLARLINK_API CallbackSink : public LogSink {
public:
  explicit CallbackSink(std::function<void(const LogRecord &)> callback)
      : callback_(std::move(callback)) {}

  void write(const LogRecord &record) override {
    if (callback_) {
      callback_(record);
    }
  }

private:
  std::function<void(const LogRecord &)> callback_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Process-wide logger
 *
 * Starts with a single ConsoleSink at Info. Thread-safe.
 */
class POLARLINK_API Logger {
public:
  static Logger &instance();

  void set_level(LogLevel level);
  LogLevel level() const;

  bool should_log(LogLevel level) const;

  void add_sink(std::shared_ptr<LogSink> sink);

  /// Removes all sinks, including the default console sink
  void clear_sinks();

  /// Restores the default: Info level, console sink only
  void reset();

  void log(LogLevel level, const std::string &module,
           const std::string &message, const char *file = nullptr,
           int line = 0);

  void flush();

private:
  Logger();

  mutable std::mutex mutex_;
  LogLevel level_ = LogLevel::Info;
  std::vector<std::shared_ptr<LogSink>> sinks_;
};

} // namespace polarlink

// ============================================================================
// Logging Macros
// ============================================================================

#define POLARLINK_LOG(lvl, module, expr)                                       \
  do {                                                                         \
    auto &_logger = ::polarlink::Logger::instance();                           \
    if (_logger.should_log(lvl)) {                                             \
      std::ostringstream _oss;                                                 \
      _oss << expr;                                                            \
      _logger.log(lvl, module, _oss.str(), __FILE__, __LINE__);                \
    }                                                                          \
  } while (0)

#define POLARLINK_LOG_TRACE(module, expr)                                      \
  POLARLINK_LOG(::polarlink::LogLevel::Trace, module, expr)
#define POLARLINK_LOG_DEBUG(module, expr)                                      \
  POLARLINK_LOG(::polarlink::LogLevel::Debug, module, expr)
#define POLARLINK_LOG_INFO(module, expr)                                       \
  POLARLINK_LOG(::polarlink::LogLevel::Info, module, expr)
#define POLARLINK_LOG_WARN(module, expr)                                       \
  POLARLINK_LOG(::polarlink::LogLevel::Warn, module, expr)
#define POLARLINK_LOG_ERROR(module, expr)                                      \
  POLARLINK_LOG(::polarlink::LogLevel::Error, module, expr)

#endif // POLARLINK_LOG_H
