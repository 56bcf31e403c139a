/**
 * @file change_event.h
 * @brief Clipboard change notifications
 */

#ifndef CLIPSAFE_CHANGE_EVENT_H
#define CLIPSAFE_CHANGE_EVENT_H

#include "logging.h"
#include "platform.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace clipsafe {

// ============================================================================
// Observed State
// ============================================================================

/**
 * @brief Snapshot of the clipboard flags compared between polls
 */
struct CLIPSAFE_API ObservedState {
  bool has_text = false;
  bool has_image = false;
  bool has_ownership = false;

  bool operator==(const ObservedState &other) const {
    return has_text == other.has_text && has_image == other.has_image &&
           has_ownership == other.has_ownership;
  }
  bool operator!=(const ObservedState &other) const {
    return !(*this == other);
  }

  std::string to_string() const;
};

// ============================================================================
// Change Event
// ============================================================================

/**
 * @brief Clipboard state at the moment a change was detected
 */
class CLIPSAFE_API ChangeEvent {
public:
  /// Stamps the event with the current UTC time
  explicit ChangeEvent(const ObservedState &state);

  std::chrono::system_clock::time_point timestamp() const { return timestamp_; }
  bool has_text() const { return state_.has_text; }
  bool has_image() const { return state_.has_image; }
  bool has_ownership() const { return state_.has_ownership; }
  const ObservedState &state() const { return state_; }

private:
  std::chrono::system_clock::time_point timestamp_;
  ObservedState state_;
};

// ============================================================================
// Change Notifier
// ============================================================================

using ChangeCallback = std::function<void(const ChangeEvent &)>;
using SubscriptionId = uint64_t;

/**
 * @brief Dynamic set of change observers
 *
 * Callbacks run in registration order. dispatch() snapshots the
 * subscriber list and runs callbacks outside the lock, so a callback may
 * subscribe or unsubscribe (itself included) without deadlocking. A
 * callback added during a dispatch may or may not see that event.
 */
class CLIPSAFE_API ChangeNotifier {
public:
  explicit ChangeNotifier(logging::Logger logger = nullptr);

  /**
   * @brief Register an observer
   * @return Token for unsubscribe()
   */
  SubscriptionId subscribe(ChangeCallback callback);

  /**
   * @brief Remove an observer
   * @return true if the token was registered
   */
  bool unsubscribe(SubscriptionId id);

  /// Number of registered observers
  size_t size() const;

  /**
   * @brief Deliver an event to every observer
   *
   * An observer throwing std::exception is logged and skipped; the rest
   * still receive the event.
   */
  void dispatch(const ChangeEvent &event) const;

private:
  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 0;
  std::map<SubscriptionId, ChangeCallback> callbacks_;
  logging::Logger logger_;
};

} // namespace clipsafe

#endif // CLIPSAFE_CHANGE_EVENT_H
