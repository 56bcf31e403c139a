/**
 * @file fake_native_clipboard.h
 * @brief In-memory NativeClipboardApi for tests
 */

#ifndef CLIPSAFE_TESTS_FAKE_NATIVE_CLIPBOARD_H
#define CLIPSAFE_TESTS_FAKE_NATIVE_CLIPBOARD_H

#include <clipsafe/native_api.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clipsafe {
namespace test {

/**
 * @brief Clipboard that lives in memory and counts every native call
 *
 * set_text/set_image take ownership of the clipboard; simulate_external_*
 * emulate another application and mark a pending change for poll().
 */
class FakeNativeClipboard : public NativeClipboardApi {
public:
  enum class CreateMode { Valid, Null, AllOnes, Throw };

  // ========================================================================
  // Configuration
  // ========================================================================

  CreateMode create_mode = CreateMode::Valid;
  bool destroy_throws = false;

  /// Status returned by set_text/set_image/clear (0 = success)
  std::atomic<int> write_status{0};

  /// Non-zero values are returned as-is by the matching query
  std::atomic<int> has_text_override{0};
  std::atomic<int> has_image_override{0};
  std::atomic<int> has_ownership_override{0};

  /// Make has_text/has_image/has_ownership throw
  std::atomic<bool> queries_throw{false};

  /// Report lengths without touching the stored image
  std::optional<int> image_length_override;

  /**
   * @brief Replace the default poll behavior
   *
   * Receives the 1-based poll count; the return value is the poll status.
   * A script may throw to emulate a failing poll.
   */
  void set_poll_script(std::function<int(int)> script) {
    std::lock_guard<std::mutex> lock(mutex_);
    poll_script_ = std::move(script);
  }

  /// Make every poll block until release_blocked_poll()
  void block_polls() {
    std::lock_guard<std::mutex> lock(mutex_);
    block_polls_ = true;
  }

  void release_blocked_poll() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      block_polls_ = false;
    }
    cv_.notify_all();
  }

  /// Wait until a poll is blocked inside the fake
  bool wait_for_blocked_poll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return polls_blocked_ > 0; });
  }

  // ========================================================================
  // External changes
  // ========================================================================

  void simulate_external_text(const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    text_ = text;
    image_.reset();
    owned_ = false;
    pending_change_ = true;
  }

  void simulate_external_image(const std::vector<uint8_t> &image) {
    std::lock_guard<std::mutex> lock(mutex_);
    image_ = image;
    text_.reset();
    owned_ = false;
    pending_change_ = true;
  }

  /// Mark a change that leaves every flag as it was
  void simulate_external_touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_change_ = true;
  }

  // ========================================================================
  // Counters
  // ========================================================================

  std::atomic<int> create_calls{0};
  std::atomic<int> destroy_calls{0};
  std::atomic<int> set_text_calls{0};
  std::atomic<int> get_text_calls{0};
  std::atomic<int> set_image_calls{0};
  std::atomic<int> get_image_calls{0};
  std::atomic<int> poll_calls{0};
  std::atomic<int> query_calls{0};
  std::atomic<int> free_calls{0};
  std::atomic<int> outstanding_buffers{0};
  std::atomic<int> calls_after_destroy{0};

  std::string last_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_text_;
  }

  // ========================================================================
  // NativeClipboardApi
  // ========================================================================

  clipboard_c *create() override {
    ++create_calls;
    switch (create_mode) {
    case CreateMode::Null:
      return nullptr;
    case CreateMode::AllOnes:
      return reinterpret_cast<clipboard_c *>(~static_cast<uintptr_t>(0));
    case CreateMode::Throw:
      throw std::runtime_error("display connection refused");
    case CreateMode::Valid:
      break;
    }
    alive_ = true;
    return instance();
  }

  void destroy(clipboard_c *cb) override {
    check(cb);
    ++destroy_calls;
    alive_ = false;
    if (destroy_throws) {
      throw std::runtime_error("destroy failed");
    }
  }

  int set_text(clipboard_c *cb, const char *text) override {
    check(cb);
    ++set_text_calls;
    int status = write_status.load();
    if (status != 0) {
      return status;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    text_ = std::string(text);
    last_text_ = *text_;
    image_.reset();
    owned_ = true;
    pending_change_ = true;
    return 0;
  }

  char *get_text(clipboard_c *cb) override {
    check(cb);
    ++get_text_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!text_) {
      return nullptr;
    }
    char *copy = new char[text_->size() + 1];
    std::memcpy(copy, text_->c_str(), text_->size() + 1);
    ++outstanding_buffers;
    return copy;
  }

  void free_text(clipboard_c *cb, char *text) override {
    check(cb);
    ++free_calls;
    --outstanding_buffers;
    delete[] text;
  }

  int set_image(clipboard_c *cb, const uint8_t *data, int length) override {
    check(cb);
    ++set_image_calls;
    int status = write_status.load();
    if (status != 0) {
      return status;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    image_ = std::vector<uint8_t>(data, data + length);
    text_.reset();
    owned_ = true;
    pending_change_ = true;
    return 0;
  }

  uint8_t *get_image(clipboard_c *cb, int *length) override {
    check(cb);
    ++get_image_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!image_) {
      *length = 0;
      return nullptr;
    }
    auto *copy = new uint8_t[image_->empty() ? 1 : image_->size()];
    std::memcpy(copy, image_->data(), image_->size());
    *length = image_length_override ? *image_length_override
                                    : static_cast<int>(image_->size());
    ++outstanding_buffers;
    return copy;
  }

  void free_image(clipboard_c *cb, uint8_t *data) override {
    check(cb);
    ++free_calls;
    --outstanding_buffers;
    delete[] data;
  }

  int has_text(clipboard_c *cb) override {
    check(cb);
    ++query_calls;
    if (queries_throw.load()) {
      throw std::runtime_error("has_text unavailable");
    }
    if (has_text_override.load() != 0) {
      return has_text_override.load();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return text_ ? 1 : 0;
  }

  int has_image(clipboard_c *cb) override {
    check(cb);
    ++query_calls;
    if (queries_throw.load()) {
      throw std::runtime_error("has_image unavailable");
    }
    if (has_image_override.load() != 0) {
      return has_image_override.load();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return image_ ? 1 : 0;
  }

  int has_ownership(clipboard_c *cb) override {
    check(cb);
    ++query_calls;
    if (queries_throw.load()) {
      throw std::runtime_error("has_ownership unavailable");
    }
    if (has_ownership_override.load() != 0) {
      return has_ownership_override.load();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return owned_ ? 1 : 0;
  }

  int poll(clipboard_c *cb) override {
    check(cb);
    int tick = ++poll_calls;
    std::unique_lock<std::mutex> lock(mutex_);
    if (block_polls_) {
      ++polls_blocked_;
      cv_.notify_all();
      cv_.wait(lock, [this] { return !block_polls_; });
      --polls_blocked_;
    }
    if (poll_script_) {
      auto script = poll_script_;
      lock.unlock();
      return script(tick);
    }
    bool changed = pending_change_;
    pending_change_ = false;
    return changed ? 1 : 0;
  }

  int clear(clipboard_c *cb) override {
    check(cb);
    int status = write_status.load();
    if (status != 0) {
      return status;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    text_.reset();
    image_.reset();
    owned_ = false;
    pending_change_ = true;
    return 0;
  }

private:
  clipboard_c *instance() { return reinterpret_cast<clipboard_c *>(&token_); }

  void check(clipboard_c *cb) {
    if (!alive_.load() || cb != instance()) {
      ++calls_after_destroy;
    }
  }

  int token_ = 0;
  std::atomic<bool> alive_{false};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<std::string> text_;
  std::optional<std::vector<uint8_t>> image_;
  std::string last_text_;
  bool owned_ = false;
  bool pending_change_ = false;
  bool block_polls_ = false;
  int polls_blocked_ = 0;
  std::function<int(int)> poll_script_;
};

} // namespace test
} // namespace clipsafe

#endif // CLIPSAFE_TESTS_FAKE_NATIVE_CLIPBOARD_H
