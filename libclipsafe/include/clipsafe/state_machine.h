/**
 * @file state_machine.h
 * @brief Polling engine state machine for clipsafe
 *
 * Tracks the lifecycle of change-detection runs with validated
 * transitions.
 */

#ifndef CLIPSAFE_STATE_MACHINE_H
#define CLIPSAFE_STATE_MACHINE_H

#include "clipsafe/error.h"
#include "clipsafe/platform.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <set>

namespace clipsafe {

// ============================================================================
// Polling State
// ============================================================================

/**
 * @brief Lifecycle of a session's polling engine
 */
enum class PollingState : uint8_t {
  /// No run active
  Idle = 0,

  /// A run is polling
  Running = 1,

  /// Stop requested, run has not exited yet
  Stopping = 2,

  /// Session disposed (terminal)
  Closed = 3
};

/**
 * @brief Get human-readable name for polling state
 */
CLIPSAFE_API const char *polling_state_name(PollingState state);

// ============================================================================
// Polling State Machine
// ============================================================================

/**
 * @brief Manages state transitions for the polling engine
 *
 * Idle -> Running -> Stopping -> Idle, where Running -> Running is a
 * restart that supersedes the current run and any state may move to
 * Closed. Thread-safe.
 *
 * @code
 *   PollingStateMachine sm;
 *   sm.transition(PollingState::Running);
 *   sm.transition(PollingState::Stopping);
 *   sm.transition(PollingState::Idle);
 * @endcode
 */
class CLIPSAFE_API PollingStateMachine {
public:
  PollingStateMachine();
  explicit PollingStateMachine(PollingState initial);

  /**
   * @brief Get current state
   */
  PollingState current() const;

  /**
   * @brief Attempt to transition to a new state
   * @param to Target state
   * @return Success or InvalidState if transition is invalid
   */
  Result<void> transition(PollingState to);

  /**
   * @brief Check if transition to state is valid
   */
  bool can_transition(PollingState to) const;

  /**
   * @brief Get all valid next states from current state
   */
  std::set<PollingState> valid_transitions() const;

  /**
   * @brief Check if a run is active (Running or Stopping)
   */
  bool is_active() const;

  /**
   * @brief Check if the machine reached Closed
   */
  bool is_terminal() const;

private:
  mutable std::mutex mutex_;
  PollingState state_;

  static const std::map<PollingState, std::set<PollingState>>
      valid_transitions_;
};

} // namespace clipsafe

#endif // CLIPSAFE_STATE_MACHINE_H
