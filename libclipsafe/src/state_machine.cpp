/**
 * @file state_machine.cpp
 * @brief Polling state machine implementation
 */

#include "clipsafe/state_machine.h"

#include <string>

namespace clipsafe {

const char *polling_state_name(PollingState state) {
  switch (state) {
  case PollingState::Idle:
    return "Idle";
  case PollingState::Running:
    return "Running";
  case PollingState::Stopping:
    return "Stopping";
  case PollingState::Closed:
    return "Closed";
  default:
    return "Invalid";
  }
}

// ============================================================================
// Polling State Machine
// ============================================================================

// Define valid state transitions
const std::map<PollingState, std::set<PollingState>>
    PollingStateMachine::valid_transitions_ = {
        // Idle -> Running, Closed
        {PollingState::Idle, {PollingState::Running, PollingState::Closed}},

        // Running -> Running (restart), Stopping, Idle (run ended), Closed
        {PollingState::Running,
         {PollingState::Running, PollingState::Stopping, PollingState::Idle,
          PollingState::Closed}},

        // Stopping -> Idle, Running (restart before exit), Closed
        {PollingState::Stopping,
         {PollingState::Idle, PollingState::Running, PollingState::Closed}},

        // Terminal state has no valid transitions
        {PollingState::Closed, {}}};

PollingStateMachine::PollingStateMachine() : state_(PollingState::Idle) {}

PollingStateMachine::PollingStateMachine(PollingState initial)
    : state_(initial) {}

PollingState PollingStateMachine::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

Result<void> PollingStateMachine::transition(PollingState to) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return Error(ErrorCode::InvalidState,
                 std::string("Unknown state: ") + polling_state_name(state_));
  }

  if (it->second.find(to) == it->second.end()) {
    return Error(ErrorCode::InvalidState, std::string("Invalid transition: ") +
                                              polling_state_name(state_) +
                                              " -> " + polling_state_name(to));
  }

  state_ = to;
  return Result<void>::ok();
}

bool PollingStateMachine::can_transition(PollingState to) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return false;
  }
  return it->second.find(to) != it->second.end();
}

std::set<PollingState> PollingStateMachine::valid_transitions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return {};
  }
  return it->second;
}

bool PollingStateMachine::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == PollingState::Running || state_ == PollingState::Stopping;
}

bool PollingStateMachine::is_terminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == PollingState::Closed;
}

} // namespace clipsafe
