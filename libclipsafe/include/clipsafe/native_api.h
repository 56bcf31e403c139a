/**
 * @file native_api.h
 * @brief Capability surface of the native clipboard library
 *
 * Everything clipsafe does to the clipboard goes through this interface.
 * The production implementation forwards to the flat C ABI of
 * libclipboard (see native_library.h); tests plug in an in-memory
 * implementation.
 *
 * Buffer ownership: a pointer returned by get_text()/get_image() belongs
 * to the native side until it is handed back to free_text()/free_image().
 */

#ifndef CLIPSAFE_NATIVE_API_H
#define CLIPSAFE_NATIVE_API_H

#include "platform.h"
#include <cstdint>

extern "C" {
/// Opaque native clipboard instance
typedef struct clipboard_c clipboard_c;
}

namespace clipsafe {

/**
 * @brief Native clipboard operations
 *
 * Status-returning calls use 0 for success. Flag queries return
 * non-zero for true and 0 for false.
 *
 * Implementations report failures through status codes or by throwing
 * an exception derived from std::exception; nothing else may escape.
 */
class CLIPSAFE_API NativeClipboardApi {
public:
  virtual ~NativeClipboardApi() = default;

  // Lifecycle
  virtual clipboard_c *create() = 0;
  virtual void destroy(clipboard_c *cb) = 0;

  // Text
  virtual int set_text(clipboard_c *cb, const char *text) = 0;
  virtual char *get_text(clipboard_c *cb) = 0;
  virtual void free_text(clipboard_c *cb, char *text) = 0;

  // Image
  virtual int set_image(clipboard_c *cb, const uint8_t *data, int length) = 0;
  virtual uint8_t *get_image(clipboard_c *cb, int *length) = 0;
  virtual void free_image(clipboard_c *cb, uint8_t *data) = 0;

  // Status
  virtual int has_text(clipboard_c *cb) = 0;
  virtual int has_image(clipboard_c *cb) = 0;
  virtual int has_ownership(clipboard_c *cb) = 0;

  /// Non-zero when the clipboard changed since the last poll
  virtual int poll(clipboard_c *cb) = 0;

  virtual int clear(clipboard_c *cb) = 0;
};

} // namespace clipsafe

#endif // CLIPSAFE_NATIVE_API_H
