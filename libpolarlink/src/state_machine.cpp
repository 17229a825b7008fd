/**
 * @file state_machine.cpp
 * @brief Connection and stream state machine implementation
 */

#include "polarlink/state_machine.h"
#include <string>

namespace polarlink {

// ============================================================================
// State Names
// ============================================================================

const char *connection_state_name(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "Disconnected";
  case ConnectionState::Connecting:
    return "Connecting";
  case ConnectionState::Connected:
    return "Connected";
  case ConnectionState::Disconnecting:
    return "Disconnecting";
  case ConnectionState::Lost:
    return "Lost";
  case ConnectionState::Error:
    return "Error";
  default:
    return "Unknown";
  }
}

const char *stream_state_name(StreamState state) {
  switch (state) {
  case StreamState::Idle:
    return "Idle";
  case StreamState::Starting:
    return "Starting";
  case StreamState::Streaming:
    return "Streaming";
  case StreamState::Stopping:
    return "Stopping";
  default:
    return "Unknown";
  }
}

// ============================================================================
// Connection State Machine
// ============================================================================

const std::map<ConnectionState, std::set<ConnectionState>>
    ConnectionStateMachine::valid_transitions_ = {
        // Disconnected -> Connecting
        {ConnectionState::Disconnected, {ConnectionState::Connecting}},

        // Connecting -> Connected, Error, Disconnected
        {ConnectionState::Connecting,
         {ConnectionState::Connected, ConnectionState::Error,
          ConnectionState::Disconnected}},

        // Connected -> Disconnecting, Lost
        {ConnectionState::Connected,
         {ConnectionState::Disconnecting, ConnectionState::Lost}},

        // Disconnecting -> Disconnected
        {ConnectionState::Disconnecting, {ConnectionState::Disconnected}},

        // Lost -> Connecting, Disconnected
        {ConnectionState::Lost,
         {ConnectionState::Connecting, ConnectionState::Disconnected}},

        // Error -> Connecting (retry), Disconnected
        {ConnectionState::Error,
         {ConnectionState::Connecting, ConnectionState::Disconnected}}};

ConnectionStateMachine::ConnectionStateMachine()
    : state_(ConnectionState::Disconnected) {}

ConnectionState ConnectionStateMachine::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

Result<void> ConnectionStateMachine::transition(ConnectionState to) {
  ConnectionState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = valid_transitions_.find(state_);
    if (it == valid_transitions_.end() ||
        it->second.find(to) == it->second.end()) {
      return Error(ErrorCode::InvalidState,
                   std::string("Invalid connection transition: ") +
                       connection_state_name(state_) + " -> " +
                       connection_state_name(to));
    }

    from = state_;
    state_ = to;
  }

  notify(from, to);
  return Result<void>::ok();
}

void ConnectionStateMachine::force_transition(ConnectionState to) {
  ConnectionState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = state_;
    state_ = to;
  }

  if (from != to) {
    notify(from, to);
  }
}

bool ConnectionStateMachine::can_transition(ConnectionState to) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return false;
  }
  return it->second.find(to) != it->second.end();
}

std::set<ConnectionState> ConnectionStateMachine::valid_transitions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return {};
  }
  return it->second;
}

bool ConnectionStateMachine::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == ConnectionState::Connected;
}

void ConnectionStateMachine::reset() {
  force_transition(ConnectionState::Disconnected);
}

void ConnectionStateMachine::on_state_changed(StateChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_changed_cb_ = std::move(callback);
}

void ConnectionStateMachine::notify(ConnectionState from, ConnectionState to) {
  StateChangedCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = state_changed_cb_;
  }
  if (cb) {
    cb(from, to);
  }
}

// ============================================================================
// Stream State Machine
// ============================================================================

const std::map<StreamState, std::set<StreamState>>
    StreamStateMachine::valid_transitions_ = {
        {StreamState::Idle, {StreamState::Starting}},

        // Starting -> Streaming, Idle (start rejected)
        {StreamState::Starting, {StreamState::Streaming, StreamState::Idle}},

        // Streaming -> Stopping, Idle (link lost)
        {StreamState::Streaming, {StreamState::Stopping, StreamState::Idle}},

        {StreamState::Stopping, {StreamState::Idle}}};

StreamStateMachine::StreamStateMachine() : state_(StreamState::Idle) {}

StreamState StreamStateMachine::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

Result<void> StreamStateMachine::transition(StreamState to) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end() ||
      it->second.find(to) == it->second.end()) {
    return Error(ErrorCode::InvalidState,
                 std::string("Invalid stream transition: ") +
                     stream_state_name(state_) + " -> " +
                     stream_state_name(to));
  }

  state_ = to;
  return Result<void>::ok();
}

bool StreamStateMachine::can_transition(StreamState to) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return false;
  }
  return it->second.find(to) != it->second.end();
}

bool StreamStateMachine::is_streaming() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == StreamState::Streaming;
}

void StreamStateMachine::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = StreamState::Idle;
}

} // namespace polarlink
