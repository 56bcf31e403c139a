/**
 * @file native_calls.h
 * @brief Status and buffer helpers shared by the session and the engine
 */

#ifndef CLIPSAFE_NATIVE_CALLS_H
#define CLIPSAFE_NATIVE_CALLS_H

#include "clipsafe/change_event.h"
#include "clipsafe/error.h"
#include "clipsafe/logging.h"
#include "clipsafe/native_handle.h"
#include <exception>
#include <string>

namespace clipsafe {
namespace detail {

using FlagQuery = int (NativeClipboardApi::*)(clipboard_c *);

/**
 * @brief Call a has_* / poll style function of the native library
 * @return true for any non-zero answer, Disposed when the handle has been
 *         released, AccessFailed when the capability throws
 */
inline Result<bool> query_flag(NativeHandle &handle, FlagQuery query,
                               const char *name) {
  clipboard_c *raw = handle.get();
  if (NativeHandle::is_invalid_value(raw)) {
    return Error(ErrorCode::Disposed, "Native clipboard instance released");
  }

  try {
    return (handle.api().*query)(raw) != 0;
  } catch (const std::exception &e) {
    return Error(ErrorCode::AccessFailed, std::string("Native ") + name +
                                              " failed",
                 e.what());
  }
}

/**
 * @brief Read has_text/has_image/has_ownership in one snapshot
 */
inline Result<ObservedState> query_state(NativeHandle &handle) {
  auto text = query_flag(handle, &NativeClipboardApi::has_text, "has_text");
  if (text.is_error()) {
    return text.error();
  }
  auto image = query_flag(handle, &NativeClipboardApi::has_image, "has_image");
  if (image.is_error()) {
    return image.error();
  }
  auto ownership =
      query_flag(handle, &NativeClipboardApi::has_ownership, "has_ownership");
  if (ownership.is_error()) {
    return ownership.error();
  }

  ObservedState state;
  state.has_text = text.value();
  state.has_image = image.value();
  state.has_ownership = ownership.value();
  return state;
}

/**
 * @brief Buffer owned by the native library, freed with its paired call
 *
 * The free runs exactly once, on whichever path leaves the scope first.
 */
template <typename T> class NativeBuffer {
public:
  using FreeFn = void (NativeClipboardApi::*)(clipboard_c *, T *);

  NativeBuffer(NativeHandle &handle, T *data, FreeFn free_fn,
               logging::Logger logger)
      : handle_(handle), data_(data), free_fn_(free_fn),
        logger_(std::move(logger)) {}

  ~NativeBuffer() { reset(); }

  NativeBuffer(const NativeBuffer &) = delete;
  NativeBuffer &operator=(const NativeBuffer &) = delete;

  T *get() const { return data_; }
  explicit operator bool() const { return data_ != nullptr; }

  void reset() {
    if (!data_) {
      return;
    }
    T *data = data_;
    data_ = nullptr;
    try {
      (handle_.api().*free_fn_)(handle_.get(), data);
    } catch (const std::exception &e) {
      logger_->warn("Failed to free native clipboard memory: {}", e.what());
    }
  }

private:
  NativeHandle &handle_;
  T *data_;
  FreeFn free_fn_;
  logging::Logger logger_;
};

} // namespace detail
} // namespace clipsafe

#endif // CLIPSAFE_NATIVE_CALLS_H
