/**
 * @file polling_engine.h
 * @brief Background clipboard change detection
 *
 * The engine runs at most one polling loop ("run") per session. A run
 * waits for the polling interval, raced against its cancellation token,
 * asks the native library whether the clipboard changed, and when the
 * has_text/has_image/has_ownership flags differ from the last observed
 * ones, dispatches a ChangeEvent to the session's observers.
 *
 * Native failures inside a run are logged and the run keeps going.
 */

#ifndef CLIPSAFE_POLLING_ENGINE_H
#define CLIPSAFE_POLLING_ENGINE_H

#include "cancellation.h"
#include "change_event.h"
#include "error.h"
#include "logging.h"
#include "native_handle.h"
#include "options.h"
#include "platform.h"
#include "state_machine.h"
#include <chrono>
#include <future>
#include <memory>
#include <optional>

namespace clipsafe {

/// How long disposal waits for an active run to exit
constexpr std::chrono::milliseconds DISPOSE_GRACE_PERIOD{1000};

// ============================================================================
// Polling Task
// ============================================================================

/**
 * @brief Completion handle of one polling run
 *
 * Completes when the run's loop has exited. Never carries an error:
 * failures inside the loop are handled there.
 */
class CLIPSAFE_API PollingTask {
public:
  PollingTask() = default;
  explicit PollingTask(std::shared_future<void> future)
      : future_(std::move(future)) {}

  /// Task that has already completed
  static PollingTask completed();

  /// Check if this refers to a run
  bool valid() const { return future_.valid(); }

  /// Check if the run has exited
  bool is_complete() const;

  /// Block until the run has exited
  void wait() const;

  /**
   * @brief Block until the run exits or timeout elapses
   * @return true if the run exited
   */
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  std::shared_future<void> future_;
};

// ============================================================================
// Polling Engine
// ============================================================================

/**
 * @brief Owns the change-detection runs of one session
 *
 * Starting a run cancels the current one and returns without blocking on
 * it. A native call the superseded run is already inside completes; it
 * starts no new one after the cancel. Iterations of different runs never
 * overlap.
 * The worker of a run shares ownership of the handle, notifier and
 * logger, so it stays memory-safe even if it outlives close().
 *
 * @code
 *   PollingEngine engine(handle, notifier, options);
 *   auto task = engine.start();
 *   ...
 *   engine.stop();
 *   task.value().wait();
 * @endcode
 */
class CLIPSAFE_API PollingEngine {
public:
  PollingEngine(std::shared_ptr<NativeHandle> handle,
                std::shared_ptr<ChangeNotifier> notifier,
                const ClipboardOptions &options,
                logging::Logger logger = nullptr);

  /// Closes the engine (see close())
  ~PollingEngine();

  // Non-copyable
  PollingEngine(const PollingEngine &) = delete;
  PollingEngine &operator=(const PollingEngine &) = delete;

  /**
   * @brief Start a new run, superseding the current one
   * @param interval Polling interval (options value when empty)
   * @param token External cancellation; cancelling it ends the run
   * @return Handle of the new run; an already-completed task when change
   *         detection is disabled; InvalidArgument or Disposed on error
   */
  Result<PollingTask> start(std::optional<std::chrono::milliseconds> interval =
                                std::nullopt,
                            CancellationToken token = CancellationToken());

  /**
   * @brief Request the current run to stop (does not wait)
   */
  void stop();

  /**
   * @brief Stop for good: cancel, wait up to grace, release the source
   * @return true if no run was left running after the grace period
   *
   * Idempotent. When called from the run's own worker (an observer
   * disposing the session) the wait is skipped.
   */
  bool close(std::chrono::milliseconds grace = DISPOSE_GRACE_PERIOD);

  /// Current lifecycle state
  PollingState state() const;

  /// Check if a run is active
  bool is_running() const;

private:
  class Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace clipsafe

#endif // CLIPSAFE_POLLING_ENGINE_H
