/**
 * @file native_handle.cpp
 * @brief Native clipboard instance ownership
 */

#include "clipsafe/native_handle.h"

#include <cstdint>
#include <exception>

namespace clipsafe {

bool NativeHandle::is_invalid_value(const clipboard_c *value) {
  auto raw = reinterpret_cast<uintptr_t>(value);
  return raw == 0 || raw == ~static_cast<uintptr_t>(0);
}

Result<std::shared_ptr<NativeHandle>>
NativeHandle::acquire(std::shared_ptr<NativeClipboardApi> api,
                      logging::Logger logger) {
  if (!logger) {
    logger = logging::get();
  }

  if (!api) {
    return Error(ErrorCode::LibraryNotFound,
                 "Native libclipboard library not available");
  }

  clipboard_c *raw = nullptr;
  try {
    raw = api->create();
  } catch (const std::exception &e) {
    return Error(ErrorCode::InitializationFailed,
                 "Failed to initialize clipboard due to an unexpected error",
                 e.what());
  }

  if (is_invalid_value(raw)) {
    return Error(ErrorCode::CreationRejected,
                 "Failed to initialize native clipboard instance. The native "
                 "library may not be available or compatible.");
  }

  logger->debug("Clipboard instance initialized successfully");
  return std::shared_ptr<NativeHandle>(
      new NativeHandle(std::move(api), raw, std::move(logger)));
}

NativeHandle::NativeHandle(std::shared_ptr<NativeClipboardApi> api,
                           clipboard_c *handle, logging::Logger logger)
    : api_(std::move(api)), handle_(handle), logger_(std::move(logger)) {}

NativeHandle::~NativeHandle() { release(); }

bool NativeHandle::release() {
  clipboard_c *raw = handle_.exchange(nullptr);
  if (is_invalid_value(raw)) {
    return false;
  }

  try {
    api_->destroy(raw);
  } catch (const std::exception &e) {
    // Nothing can be done about a failed destroy; the handle stays released
    logger_->warn("Failed to destroy native clipboard instance: {}", e.what());
  }
  return true;
}

bool NativeHandle::is_valid() const { return !is_invalid_value(handle_.load()); }

} // namespace clipsafe
