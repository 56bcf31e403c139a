/**
 * @file native_handle.h
 * @brief Exclusive owner of one native clipboard instance
 */

#ifndef CLIPSAFE_NATIVE_HANDLE_H
#define CLIPSAFE_NATIVE_HANDLE_H

#include "error.h"
#include "logging.h"
#include "native_api.h"
#include "platform.h"
#include <atomic>
#include <memory>

namespace clipsafe {

/**
 * @brief Owns a clipboard_c instance and destroys it exactly once
 *
 * Null and all-ones are both invalid handle values. release() is
 * idempotent. The destructor performs the bare release only, touching
 * nothing but the native reference and its capability surface, so a
 * handle dropped without explicit release (abandoned by its owner, or
 * kept alive by a worker that outlived its session) still frees the
 * native instance.
 *
 * @code
 *   auto handle = NativeHandle::acquire(api);
 *   if (!handle) {
 *       // handle.error().code is LibraryNotFound, CreationRejected
 *       // or InitializationFailed
 *   }
 * @endcode
 */
class CLIPSAFE_API NativeHandle {
public:
  /**
   * @brief Create a native clipboard instance
   * @param api Capability surface (null means the library was not found)
   * @param logger Logger for diagnostics (default logger when null)
   */
  static Result<std::shared_ptr<NativeHandle>>
  acquire(std::shared_ptr<NativeClipboardApi> api,
          logging::Logger logger = nullptr);

  ~NativeHandle();

  // Non-copyable, non-movable
  NativeHandle(const NativeHandle &) = delete;
  NativeHandle &operator=(const NativeHandle &) = delete;

  /**
   * @brief Destroy the native instance
   * @return true if this call destroyed it, false if already released
   *
   * Destroy-time failures are logged and swallowed.
   */
  bool release();

  /// Check whether the native instance is still alive
  bool is_valid() const;

  /// Raw native pointer (invalid after release)
  clipboard_c *get() const { return handle_.load(); }

  /// Capability surface the instance was created with
  NativeClipboardApi &api() const { return *api_; }

  /// Check a raw value against the invalid sentinels
  static bool is_invalid_value(const clipboard_c *value);

private:
  NativeHandle(std::shared_ptr<NativeClipboardApi> api, clipboard_c *handle,
               logging::Logger logger);

  std::shared_ptr<NativeClipboardApi> api_;
  std::atomic<clipboard_c *> handle_;
  logging::Logger logger_;
};

} // namespace clipsafe

#endif // CLIPSAFE_NATIVE_HANDLE_H
