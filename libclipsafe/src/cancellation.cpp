/**
 * @file cancellation.cpp
 * @brief Cooperative cancellation implementation
 */

#include "clipsafe/cancellation.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace clipsafe {
namespace detail {

class CancellationState {
public:
  bool is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  void cancel() {
    std::vector<std::function<void()>> callbacks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_) {
        return;
      }
      cancelled_ = true;

      callbacks.reserve(callbacks_.size());
      for (auto &entry : callbacks_) {
        callbacks.push_back(std::move(entry.second));
      }
      callbacks_.clear();
    }

    cv_.notify_all();

    // Callbacks run outside the lock so they may register or cancel freely
    for (auto &callback : callbacks) {
      callback();
    }
  }

  bool wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_; });
  }

  /// @return Registration id, or 0 if already cancelled
  uint64_t add(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return 0;
    }
    uint64_t id = ++next_id_;
    callbacks_.emplace(id, std::move(callback));
    return id;
  }

  void remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  uint64_t next_id_ = 0;
  std::map<uint64_t, std::function<void()>> callbacks_;
};

} // namespace detail

// ============================================================================
// CancellationRegistration
// ============================================================================

CancellationRegistration::CancellationRegistration(
    std::weak_ptr<detail::CancellationState> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() { reset(); }

CancellationRegistration::CancellationRegistration(
    CancellationRegistration &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
  other.id_ = 0;
}

CancellationRegistration &
CancellationRegistration::operator=(CancellationRegistration &&other) noexcept {
  if (this != &other) {
    reset();
    state_ = std::move(other.state_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void CancellationRegistration::reset() {
  if (id_ != 0) {
    if (auto state = state_.lock()) {
      state->remove(id_);
    }
  }
  state_.reset();
  id_ = 0;
}

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::is_cancellation_requested() const {
  return state_ && state_->is_cancelled();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
  if (!state_) {
    // Nothing can cancel this wait
    std::this_thread::sleep_for(duration);
    return false;
  }
  return state_->wait_for(duration);
}

CancellationRegistration
CancellationToken::register_callback(std::function<void()> callback) const {
  if (!state_) {
    return CancellationRegistration();
  }

  uint64_t id = state_->add(callback);
  if (id == 0) {
    callback();
    return CancellationRegistration();
  }
  return CancellationRegistration(state_, id);
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::~CancellationSource() = default;

CancellationSource::CancellationSource(CancellationSource &&) noexcept = default;
CancellationSource &
CancellationSource::operator=(CancellationSource &&) noexcept = default;

CancellationSource CancellationSource::linked(const CancellationToken &parent) {
  CancellationSource source;
  std::weak_ptr<detail::CancellationState> weak = source.state_;
  source.parent_link_ = parent.register_callback([weak] {
    if (auto state = weak.lock()) {
      state->cancel();
    }
  });
  return source;
}

void CancellationSource::cancel() {
  if (state_) {
    state_->cancel();
  }
}

bool CancellationSource::is_cancellation_requested() const {
  return state_ && state_->is_cancelled();
}

CancellationToken CancellationSource::token() const {
  return CancellationToken(state_);
}

void CancellationSource::dispose() { parent_link_.reset(); }

} // namespace clipsafe
