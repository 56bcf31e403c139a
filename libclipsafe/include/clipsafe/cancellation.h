/**
 * @file cancellation.h
 * @brief Cooperative cancellation for polling runs
 *
 * A CancellationSource owns the right to cancel; CancellationToken is the
 * observing side handed to the work being cancelled. Tokens can wait for
 * a duration raced against cancellation, which is the suspension point of
 * the polling loop.
 *
 * @code
 *   CancellationSource source;
 *   auto task = clipboard->start_monitoring(std::nullopt, source.token());
 *   ...
 *   source.cancel();
 *   task.value().wait();
 * @endcode
 */

#ifndef CLIPSAFE_CANCELLATION_H
#define CLIPSAFE_CANCELLATION_H

#include "platform.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace clipsafe {

namespace detail {
class CancellationState;
}

/**
 * @brief Keeps a cancellation callback registered while alive
 *
 * Destroying (or reset()ing) the registration removes the callback. A
 * callback that is already running may still complete afterwards.
 */
class CLIPSAFE_API CancellationRegistration {
public:
  CancellationRegistration() = default;
  CancellationRegistration(std::weak_ptr<detail::CancellationState> state,
                           uint64_t id);
  ~CancellationRegistration();

  CancellationRegistration(CancellationRegistration &&other) noexcept;
  CancellationRegistration &operator=(CancellationRegistration &&other) noexcept;

  CancellationRegistration(const CancellationRegistration &) = delete;
  CancellationRegistration &operator=(const CancellationRegistration &) = delete;

  /// Unregister the callback now
  void reset();

private:
  std::weak_ptr<detail::CancellationState> state_;
  uint64_t id_ = 0;
};

/**
 * @brief Observing side of a cancellation signal
 *
 * A default-constructed token is never cancelled.
 */
class CLIPSAFE_API CancellationToken {
public:
  CancellationToken() = default;

  /// Token that can never be cancelled
  static CancellationToken none() { return CancellationToken(); }

  /// Check if cancellation has been requested
  bool is_cancellation_requested() const;

  /// Check if this token is attached to a source
  bool can_be_cancelled() const { return state_ != nullptr; }

  /**
   * @brief Wait for a duration or until cancelled
   * @return true if cancelled, false if the full duration elapsed
   */
  bool wait_for(std::chrono::milliseconds duration) const;

  /**
   * @brief Run callback when cancellation is requested
   *
   * Runs immediately on the calling thread if already cancelled.
   */
  CancellationRegistration register_callback(std::function<void()> callback) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owner of a cancellation signal
 */
class CLIPSAFE_API CancellationSource {
public:
  CancellationSource();
  ~CancellationSource();

  CancellationSource(CancellationSource &&) noexcept;
  CancellationSource &operator=(CancellationSource &&) noexcept;

  CancellationSource(const CancellationSource &) = delete;
  CancellationSource &operator=(const CancellationSource &) = delete;

  /**
   * @brief Create a source that is also cancelled when parent is
   */
  static CancellationSource linked(const CancellationToken &parent);

  /// Request cancellation (idempotent)
  void cancel();

  /// Check if cancellation has been requested
  bool is_cancellation_requested() const;

  /// Token observing this source
  CancellationToken token() const;

  /**
   * @brief Drop the link to the parent token
   *
   * Tokens already handed out keep working; they just no longer follow
   * the parent.
   */
  void dispose();

private:
  std::shared_ptr<detail::CancellationState> state_;
  CancellationRegistration parent_link_;
};

} // namespace clipsafe

#endif // CLIPSAFE_CANCELLATION_H
