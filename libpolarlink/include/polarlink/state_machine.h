/**
 * @file state_machine.h
 * @brief Connection and stream state machines for PolarLink
 *
 * Manages link and stream states with validated transitions and
 * callbacks.
 */

#ifndef POLARLINK_STATE_MACHINE_H
#define POLARLINK_STATE_MACHINE_H

#include "error.h"
#include "platform.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace polarlink {

// ============================================================================
// States
// ============================================================================

/**
 * @brief State of the BLE link to the sensor
 */
enum class ConnectionState : uint8_t {
  /// No link
  Disconnected = 0,

  /// Discovering / connecting / resolving services
  Connecting = 1,

  /// Link up and required services present
  Connected = 2,

  /// Clean shutdown in progress
  Disconnecting = 3,

  /// Link dropped or went silent; reconnect may follow
  Lost = 4,

  /// Last connection attempt failed
  Error = 255
};

POLARLINK_API const char *connection_state_name(ConnectionState state);

/**
 * @brief State of a PMD measurement stream
 */
enum class StreamState : uint8_t {
  Idle = 0,
  Starting = 1,
  Streaming = 2,
  Stopping = 3
};

POLARLINK_API const char *stream_state_name(StreamState state);

// ============================================================================
// Connection State Machine
// ============================================================================

/**
 * @brief Enforces valid link state transitions
 *
 * Thread-safe.
 *
 * @code
 *   ConnectionStateMachine sm;
 *
 *   sm.on_state_changed([](ConnectionState from, ConnectionState to) {
 *       std::cout << connection_state_name(from) << " -> "
 *                 << connection_state_name(to) << std::endl;
 *   });
 *
 *   sm.transition(ConnectionState::Connecting);
 *   sm.transition(ConnectionState::Connected);
 * @endcode
 */
class POLARLINK_API ConnectionStateMachine {
public:
  ConnectionStateMachine();

  ConnectionState current() const;

  /**
   * @brief Attempt to transition to a new state
   * @return InvalidState if the edge is not allowed
   */
  Result<void> transition(ConnectionState to);

  /**
   * @brief Move to a state without validation
   *
   * Used by disconnect(), which must reach Disconnected from anywhere.
   */
  void force_transition(ConnectionState to);

  bool can_transition(ConnectionState to) const;
  std::set<ConnectionState> valid_transitions() const;
  bool is_connected() const;
  void reset();

  using StateChangedCallback =
      std::function<void(ConnectionState from, ConnectionState to)>;

  /// Called after each change, outside the internal lock
  void on_state_changed(StateChangedCallback callback);

private:
  void notify(ConnectionState from, ConnectionState to);

  mutable std::mutex mutex_;
  ConnectionState state_ = ConnectionState::Disconnected;
  StateChangedCallback state_changed_cb_;

  static const std::map<ConnectionState, std::set<ConnectionState>>
      valid_transitions_;
};

// ============================================================================
// Stream State Machine
// ============================================================================

/**
 * @brief Enforces valid stream state transitions
 */
class POLARLINK_API StreamStateMachine {
public:
  StreamStateMachine();

  StreamState current() const;
  Result<void> transition(StreamState to);
  bool can_transition(StreamState to) const;
  bool is_streaming() const;
  void reset();

private:
  mutable std::mutex mutex_;
  StreamState state_ = StreamState::Idle;

  static const std::map<StreamState, std::set<StreamState>> valid_transitions_;
};

} // namespace polarlink

#endif // POLARLINK_STATE_MACHINE_H
