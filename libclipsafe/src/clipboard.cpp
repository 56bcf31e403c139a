/**
 * @file clipboard.cpp
 * @brief Clipboard session implementation
 */

#include "clipsafe/clipboard.h"
#include "clipsafe/native_handle.h"
#include "clipsafe/native_library.h"
#include "native_calls.h"

#include <atomic>
#include <climits>
#include <cstring>
#include <mutex>

namespace clipsafe {

namespace {

Error size_limit_error(const char *what, size_t size, size_t limit) {
  return Error(ErrorCode::SizeLimitExceeded,
               std::string(what) + " data size (" + std::to_string(size) +
                   " bytes) exceeds maximum allowed size (" +
                   std::to_string(limit) + " bytes).");
}

} // namespace

// ============================================================================
// ClipboardSession Implementation
// ============================================================================

class ClipboardSession::Impl {
public:
  ClipboardOptions options;
  logging::Logger logger;
  std::shared_ptr<NativeHandle> handle;
  std::shared_ptr<ChangeNotifier> notifier;
  std::unique_ptr<PollingEngine> engine;

  std::atomic<bool> disposed{false};
  std::mutex dispose_mutex;
};

Result<std::unique_ptr<ClipboardSession>>
ClipboardSession::open(const ClipboardOptions &options,
                       logging::Logger logger) {
  auto api = load_native_clipboard(options.library_path);
  if (api.is_error()) {
    return api.error();
  }
  return open(std::move(api).value(), options, std::move(logger));
}

Result<std::unique_ptr<ClipboardSession>>
ClipboardSession::open(std::shared_ptr<NativeClipboardApi> api,
                       const ClipboardOptions &options,
                       logging::Logger logger) {
  CLIPSAFE_TRY(options.validate());

  if (!logger) {
    logger = logging::get();
  }

  auto handle = NativeHandle::acquire(std::move(api), logger);
  if (handle.is_error()) {
    logger->error("Clipboard initialization failed: {}",
                  handle.error().to_string());
    return handle.error();
  }

  auto impl = std::make_unique<Impl>();
  impl->options = options;
  impl->logger = logger;
  impl->handle = std::move(handle).value();
  impl->notifier = std::make_shared<ChangeNotifier>(logger);
  impl->engine = std::make_unique<PollingEngine>(impl->handle, impl->notifier,
                                                 options, logger);

  return std::unique_ptr<ClipboardSession>(
      new ClipboardSession(std::move(impl)));
}

ClipboardSession::ClipboardSession(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

ClipboardSession::~ClipboardSession() { dispose(); }

Result<void> ClipboardSession::ensure_not_disposed() const {
  if (impl_->disposed.load()) {
    return Error(ErrorCode::Disposed,
                 "Cannot access a disposed clipboard session");
  }
  return Result<void>::ok();
}

// ============================================================================
// Text
// ============================================================================

Result<void> ClipboardSession::set_text(const std::string &text) {
  CLIPSAFE_TRY(ensure_not_disposed());

  if (text.find('\0') != std::string::npos) {
    return Error(ErrorCode::InvalidArgument,
                 "Text must not contain NUL characters");
  }

  std::string processed =
      impl_->options.trim_whitespace ? trim_whitespace(text) : text;
  if (!is_valid_utf8(processed)) {
    return Error(ErrorCode::InvalidArgument, "Text is not valid UTF-8");
  }

  // Payload includes the NUL terminator
  size_t size = processed.size() + 1;
  if (impl_->options.exceeds_size_limit(size)) {
    return size_limit_error("Text", size, impl_->options.max_data_size);
  }

  auto &handle = *impl_->handle;
  int status = handle.api().set_text(handle.get(), processed.c_str());
  if (status != 0) {
    return Error::native(ErrorCode::AccessFailed,
                         "Failed to set clipboard text", status);
  }

  impl_->logger->debug("Successfully set clipboard text ({} bytes)", size);
  return Result<void>::ok();
}

Result<std::optional<std::string>> ClipboardSession::get_text() const {
  CLIPSAFE_TRY(ensure_not_disposed());

  auto &handle = *impl_->handle;
  detail::NativeBuffer<char> buffer(handle, handle.api().get_text(handle.get()),
                                    &NativeClipboardApi::free_text,
                                    impl_->logger);
  if (!buffer) {
    impl_->logger->debug("No text available in clipboard");
    return std::optional<std::string>();
  }

  size_t length = std::strlen(buffer.get());
  if (impl_->options.exceeds_size_limit(length + 1)) {
    return size_limit_error("Text", length + 1, impl_->options.max_data_size);
  }

  std::string text(buffer.get(), length);
  if (impl_->options.trim_whitespace) {
    text = trim_whitespace(text);
  }

  impl_->logger->debug("Successfully retrieved clipboard text ({} bytes)",
                       text.size());
  return std::optional<std::string>(std::move(text));
}

bool ClipboardSession::try_get_text(std::string &text) const {
  auto result = get_text();
  if (result.is_error()) {
    impl_->logger->debug("try_get_text failed: {}", result.error().to_string());
    return false;
  }
  if (!result.value()) {
    return false;
  }
  text = std::move(*result.value());
  return true;
}

// ============================================================================
// Image
// ============================================================================

Result<void> ClipboardSession::set_image(const Bytes &image) {
  CLIPSAFE_TRY(ensure_not_disposed());

  if (impl_->options.exceeds_size_limit(image.size())) {
    return size_limit_error("Image", image.size(),
                            impl_->options.max_data_size);
  }
  if (image.size() > static_cast<size_t>(INT_MAX)) {
    return size_limit_error("Image", image.size(),
                            static_cast<size_t>(INT_MAX));
  }

  auto &handle = *impl_->handle;
  int status = handle.api().set_image(handle.get(), image.data(),
                                      static_cast<int>(image.size()));
  if (status != 0) {
    return Error::native(ErrorCode::AccessFailed,
                         "Failed to set clipboard image", status);
  }

  impl_->logger->debug("Successfully set clipboard image ({} bytes)",
                       image.size());
  return Result<void>::ok();
}

Result<std::optional<Bytes>> ClipboardSession::get_image() const {
  CLIPSAFE_TRY(ensure_not_disposed());

  auto &handle = *impl_->handle;
  int length = 0;
  detail::NativeBuffer<uint8_t> buffer(
      handle, handle.api().get_image(handle.get(), &length),
      &NativeClipboardApi::free_image, impl_->logger);
  if (!buffer || length <= 0) {
    impl_->logger->debug("No image available in clipboard");
    return std::optional<Bytes>();
  }

  auto size = static_cast<size_t>(length);
  if (impl_->options.exceeds_size_limit(size)) {
    return size_limit_error("Image", size, impl_->options.max_data_size);
  }

  Bytes image(buffer.get(), buffer.get() + size);
  impl_->logger->debug("Successfully retrieved clipboard image ({} bytes)",
                       size);
  return std::optional<Bytes>(std::move(image));
}

bool ClipboardSession::try_get_image(Bytes &image) const {
  auto result = get_image();
  if (result.is_error()) {
    impl_->logger->debug("try_get_image failed: {}",
                         result.error().to_string());
    return false;
  }
  if (!result.value()) {
    return false;
  }
  image = std::move(*result.value());
  return true;
}

// ============================================================================
// Status
// ============================================================================

Result<void> ClipboardSession::clear() {
  CLIPSAFE_TRY(ensure_not_disposed());

  auto &handle = *impl_->handle;
  int status = handle.api().clear(handle.get());
  if (status != 0) {
    return Error::native(ErrorCode::AccessFailed, "Failed to clear clipboard",
                         status);
  }

  impl_->logger->debug("Successfully cleared clipboard");
  return Result<void>::ok();
}

Result<bool> ClipboardSession::has_text() const {
  CLIPSAFE_TRY(ensure_not_disposed());
  return detail::query_flag(*impl_->handle, &NativeClipboardApi::has_text,
                            "has_text");
}

Result<bool> ClipboardSession::has_image() const {
  CLIPSAFE_TRY(ensure_not_disposed());
  return detail::query_flag(*impl_->handle, &NativeClipboardApi::has_image,
                            "has_image");
}

Result<bool> ClipboardSession::has_ownership() const {
  CLIPSAFE_TRY(ensure_not_disposed());
  return detail::query_flag(*impl_->handle, &NativeClipboardApi::has_ownership,
                            "has_ownership");
}

// ============================================================================
// Change Monitoring
// ============================================================================

Result<PollingTask> ClipboardSession::start_monitoring(
    std::optional<std::chrono::milliseconds> interval,
    CancellationToken token) {
  CLIPSAFE_TRY(ensure_not_disposed());
  return impl_->engine->start(interval, std::move(token));
}

Result<void> ClipboardSession::stop_monitoring() {
  CLIPSAFE_TRY(ensure_not_disposed());
  impl_->engine->stop();
  return Result<void>::ok();
}

Result<SubscriptionId> ClipboardSession::on_changed(ChangeCallback callback) {
  CLIPSAFE_TRY(ensure_not_disposed());
  return impl_->notifier->subscribe(std::move(callback));
}

bool ClipboardSession::remove_listener(SubscriptionId id) {
  return impl_->notifier->unsubscribe(id);
}

PollingState ClipboardSession::monitoring_state() const {
  return impl_->engine->state();
}

// ============================================================================
// Lifecycle
// ============================================================================

void ClipboardSession::dispose() {
  std::lock_guard<std::mutex> lock(impl_->dispose_mutex);
  if (impl_->disposed.load()) {
    return;
  }

  // Cancel the run, wait out the grace period, release the source
  impl_->engine->close(DISPOSE_GRACE_PERIOD);

  // A worker stuck past the grace period only reads through the handle
  impl_->handle->release();

  impl_->disposed.store(true);
  impl_->logger->debug("Clipboard instance disposed");
}

bool ClipboardSession::is_disposed() const { return impl_->disposed.load(); }

const ClipboardOptions &ClipboardSession::options() const {
  return impl_->options;
}

} // namespace clipsafe
