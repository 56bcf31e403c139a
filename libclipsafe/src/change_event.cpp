/**
 * @file change_event.cpp
 * @brief Change notification implementation
 */

#include "clipsafe/change_event.h"

#include <exception>
#include <sstream>
#include <vector>

namespace clipsafe {

std::string ObservedState::to_string() const {
  std::ostringstream oss;
  oss << "{text=" << has_text << ", image=" << has_image
      << ", ownership=" << has_ownership << "}";
  return oss.str();
}

ChangeEvent::ChangeEvent(const ObservedState &state)
    : timestamp_(std::chrono::system_clock::now()), state_(state) {}

// ============================================================================
// ChangeNotifier
// ============================================================================

ChangeNotifier::ChangeNotifier(logging::Logger logger)
    : logger_(logger ? std::move(logger) : logging::get()) {}

SubscriptionId ChangeNotifier::subscribe(ChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = ++next_id_;
  callbacks_.emplace(id, std::move(callback));
  return id;
}

bool ChangeNotifier::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.erase(id) > 0;
}

size_t ChangeNotifier::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void ChangeNotifier::dispatch(const ChangeEvent &event) const {
  std::vector<ChangeCallback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto &entry : callbacks_) {
      snapshot.push_back(entry.second);
    }
  }

  for (const auto &callback : snapshot) {
    if (!callback) {
      continue;
    }
    try {
      callback(event);
    } catch (const std::exception &e) {
      logger_->warn("Clipboard change observer failed: {}", e.what());
    }
  }
}

} // namespace clipsafe
