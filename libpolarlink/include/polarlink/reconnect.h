/**
 * @file reconnect.h
 * @brief Retry back-off and link watchdog
 */

#ifndef POLARLINK_RECONNECT_H
#define POLARLINK_RECONNECT_H

#include "platform.h"
#include <chrono>
#include <optional>

namespace polarlink {

// ============================================================================
// Reconnect Policy
// ============================================================================

/**
 * @brief Exponential back-off between connection attempts
 *
 * Attempt n (1-based) waits base_interval * 2^(n-1), capped at
 * max_interval, before the next attempt.
 */
struct POLARLINK_API ReconnectPolicy {
  int max_attempts = 5;
  std::chrono::milliseconds base_interval{1000};
  std::chrono::milliseconds max_interval{60000};

  /// Delay after the given failed attempt
  std::chrono::milliseconds delay_for_attempt(int attempt) const;

  /// True if another attempt is allowed after `attempts_made` failures
  bool should_retry(int attempts_made) const {
    return attempts_made < max_attempts;
  }
};

// ============================================================================
// Connection Watchdog
// ============================================================================

/**
 * @brief Detects a link that stays up but stops delivering data
 *
 * Armed by the first feed(); never expires before that.
 */
class POLARLINK_API ConnectionWatchdog {
public:
  using Clock = std::chrono::steady_clock;

  explicit ConnectionWatchdog(
      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
      : timeout_(timeout) {}

  void feed(Clock::time_point now = Clock::now()) { last_data_ = now; }

  bool is_expired(Clock::time_point now = Clock::now()) const {
    return last_data_ && (now - *last_data_) > timeout_;
  }

  void reset() { last_data_.reset(); }

  std::optional<Clock::time_point> last_data() const { return last_data_; }
  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
  std::optional<Clock::time_point> last_data_;
};

} // namespace polarlink

#endif // POLARLINK_RECONNECT_H
