/**
 * @file clipboard.h
 * @brief Clipboard session: safe access to the native clipboard
 *
 * A ClipboardSession owns one native clipboard instance. It offers text
 * and image access with size limits, and change monitoring through a
 * background polling run that reports to registered observers.
 *
 * Accessors are not synchronized against each other or against an active
 * polling run. Callers using one session from several threads must
 * serialize their calls.
 */

#ifndef CLIPSAFE_CLIPBOARD_H
#define CLIPSAFE_CLIPBOARD_H

#include "cancellation.h"
#include "change_event.h"
#include "error.h"
#include "logging.h"
#include "native_api.h"
#include "options.h"
#include "platform.h"
#include "polling_engine.h"
#include "state_machine.h"
#include "types.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace clipsafe {

/**
 * @brief Owner of one native clipboard instance
 *
 * Example usage:
 * @code
 *   auto opened = ClipboardSession::open();
 *   if (!opened) {
 *       std::cerr << opened.error().to_string() << std::endl;
 *       return;
 *   }
 *   auto clipboard = std::move(opened).value();
 *
 *   clipboard->on_changed([](const ChangeEvent &event) {
 *       if (event.has_text()) { ... }
 *   });
 *
 *   CancellationSource cancel;
 *   clipboard->start_monitoring(std::nullopt, cancel.token());
 *   clipboard->set_text("Hello");
 *   ...
 *   clipboard->dispose();
 * @endcode
 */
class CLIPSAFE_API ClipboardSession {
public:
  /**
   * @brief Open a session on the system libclipboard
   * @param options Session configuration (library_path selects the library)
   * @param logger Logger for diagnostics (default logger when null)
   * @return Session, or an initialization error
   */
  static Result<std::unique_ptr<ClipboardSession>>
  open(const ClipboardOptions &options = ClipboardOptions(),
       logging::Logger logger = nullptr);

  /**
   * @brief Open a session on a given capability surface
   */
  static Result<std::unique_ptr<ClipboardSession>>
  open(std::shared_ptr<NativeClipboardApi> api,
       const ClipboardOptions &options = ClipboardOptions(),
       logging::Logger logger = nullptr);

  /// Disposes the session
  ~ClipboardSession();

  // Non-copyable
  ClipboardSession(const ClipboardSession &) = delete;
  ClipboardSession &operator=(const ClipboardSession &) = delete;

  // ========================================================================
  // Text
  // ========================================================================

  /**
   * @brief Set the clipboard text
   * @param text UTF-8 text without embedded NUL characters
   * @return Success, InvalidArgument, SizeLimitExceeded or AccessFailed
   *
   * The size checked against max_data_size includes the NUL terminator.
   */
  Result<void> set_text(const std::string &text);

  /**
   * @brief Get the clipboard text
   * @return Text, an empty optional when the clipboard holds no text,
   *         or SizeLimitExceeded
   */
  Result<std::optional<std::string>> get_text() const;

  /**
   * @brief Get the clipboard text without reporting errors
   * @return true if text was retrieved
   */
  bool try_get_text(std::string &text) const;

  // ========================================================================
  // Image
  // ========================================================================

  /**
   * @brief Set the clipboard image (PNG recommended)
   * @return Success, SizeLimitExceeded or AccessFailed
   */
  Result<void> set_image(const Bytes &image);

  /**
   * @brief Get the clipboard image
   * @return Image bytes, an empty optional when there is no image,
   *         or SizeLimitExceeded
   */
  Result<std::optional<Bytes>> get_image() const;

  /**
   * @brief Get the clipboard image without reporting errors
   * @return true if image data was retrieved
   */
  bool try_get_image(Bytes &image) const;

  // ========================================================================
  // Status
  // ========================================================================

  /// Clear the clipboard
  Result<void> clear();

  Result<bool> has_text() const;
  Result<bool> has_image() const;

  /// Check if this application owns the clipboard
  Result<bool> has_ownership() const;

  // ========================================================================
  // Change Monitoring
  // ========================================================================

  /**
   * @brief Start polling for clipboard changes
   * @param interval Polling interval (options value when empty)
   * @param token Cancelling this token stops the run
   * @return Handle of the run, completed at once if change detection is
   *         disabled
   *
   * A previous run is cancelled and superseded.
   */
  Result<PollingTask>
  start_monitoring(std::optional<std::chrono::milliseconds> interval =
                       std::nullopt,
                   CancellationToken token = CancellationToken());

  /**
   * @brief Stop the current polling run
   */
  CLIPSAFE_DEPRECATED("Cancel the token passed to start_monitoring instead")
  Result<void> stop_monitoring();

  /**
   * @brief Register an observer for clipboard changes
   * @return Token for remove_listener()
   */
  Result<SubscriptionId> on_changed(ChangeCallback callback);

  /**
   * @brief Remove an observer
   * @return true if it was registered
   */
  bool remove_listener(SubscriptionId id);

  /// Current state of change monitoring
  PollingState monitoring_state() const;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Stop monitoring and release the native instance
   *
   * Cancels the polling run, waits up to DISPOSE_GRACE_PERIOD for it,
   * then destroys the native instance. Safe to call more than once and
   * from any thread; later calls do nothing. Every other operation then
   * fails with ErrorCode::Disposed.
   */
  void dispose();

  /// Check if dispose() has completed
  bool is_disposed() const;

  /// Options the session was opened with
  const ClipboardOptions &options() const;

private:
  class Impl;
  explicit ClipboardSession(std::unique_ptr<Impl> impl);

  Result<void> ensure_not_disposed() const;

  std::unique_ptr<Impl> impl_;
};

} // namespace clipsafe

#endif // CLIPSAFE_CLIPBOARD_H
