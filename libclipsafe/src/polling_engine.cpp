/**
 * @file polling_engine.cpp
 * @brief Change-detection loop and run lifecycle
 */

#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

#include "clipsafe/polling_engine.h"
#include "native_calls.h"

namespace clipsafe {

// ============================================================================
// PollingTask
// ============================================================================

PollingTask PollingTask::completed() {
  std::promise<void> promise;
  promise.set_value();
  return PollingTask(promise.get_future().share());
}

bool PollingTask::is_complete() const {
  return future_.valid() && future_.wait_for(std::chrono::seconds(0)) ==
                                std::future_status::ready;
}

void PollingTask::wait() const {
  if (future_.valid()) {
    future_.wait();
  }
}

bool PollingTask::wait_for(std::chrono::milliseconds timeout) const {
  if (!future_.valid()) {
    return true;
  }
  return future_.wait_for(timeout) == std::future_status::ready;
}

// ============================================================================
// PollingEngine Implementation
// ============================================================================

namespace {

struct RunState {
  CancellationToken token;
  std::chrono::milliseconds interval{0};
  uint64_t generation = 0;
  std::promise<void> done;
};

} // namespace

class PollingEngine::Impl {
public:
  std::shared_ptr<NativeHandle> handle;
  std::shared_ptr<ChangeNotifier> notifier;
  logging::Logger logger;
  std::chrono::milliseconds default_interval;
  bool enabled = true;

  // Guards the run bookkeeping below
  std::mutex mutex;
  // Held around the native calls of one iteration; never across dispatch
  std::mutex iteration_mutex;

  std::atomic<bool> closed{false};
  PollingStateMachine state;
  std::optional<CancellationSource> source;
  PollingTask current_task;
  std::thread::id worker_id;
  uint64_t generation = 0;

  void move_to(PollingState to) {
    auto result = state.transition(to);
    if (result.is_error()) {
      logger->error("Polling state error: {}", result.error().to_string());
    }
  }

  /// @return true when the error ends the run
  bool report(const Error &error) {
    if (!is_recoverable(error.code)) {
      logger->debug("Clipboard polling ending: {}", error.to_string());
      return true;
    }
    logger->warn("Error during clipboard polling: {}", error.to_string());
    return false;
  }

  void run_loop(const RunState &run);
  void finish(uint64_t run_generation);
};

void PollingEngine::Impl::run_loop(const RunState &run) {
  logger->debug("Starting clipboard polling with interval {}ms",
                run.interval.count());

  ObservedState baseline;
  {
    std::lock_guard<std::mutex> lock(iteration_mutex);
    auto initial = detail::query_state(*handle);
    if (initial.is_ok()) {
      baseline = initial.value();
    } else {
      logger->warn("Could not read initial clipboard state: {}",
                   initial.error().to_string());
    }
  }

  while (!run.token.is_cancellation_requested()) {
    if (run.token.wait_for(run.interval)) {
      break;
    }
    if (closed.load()) {
      break;
    }

    std::optional<ChangeEvent> event;
    try {
      std::lock_guard<std::mutex> lock(iteration_mutex);
      if (run.token.is_cancellation_requested() || closed.load()) {
        break;
      }

      auto changed =
          detail::query_flag(*handle, &NativeClipboardApi::poll, "poll");
      if (changed.is_error()) {
        if (report(changed.error())) {
          break;
        }
        continue;
      }
      if (!changed.value()) {
        continue;
      }

      auto current = detail::query_state(*handle);
      if (current.is_error()) {
        if (report(current.error())) {
          break;
        }
        continue;
      }

      if (current.value() != baseline) {
        event.emplace(current.value());
        baseline = current.value();
      } else {
        logger->trace("Clipboard changed but flags are unchanged: {}",
                      baseline.to_string());
      }
    } catch (const std::exception &e) {
      logger->warn("Error during clipboard polling: {}", e.what());
      continue;
    }

    if (event && !run.token.is_cancellation_requested()) {
      notifier->dispatch(*event);
      logger->debug("Clipboard change detected and event fired: {}",
                    event->state().to_string());
    }
  }

  logger->debug("Clipboard polling stopped");
}

void PollingEngine::Impl::finish(uint64_t run_generation) {
  std::lock_guard<std::mutex> lock(mutex);
  if (run_generation != generation || closed.load()) {
    // Superseded or closed; the newer owner of the state decides
    return;
  }
  if (state.is_active()) {
    move_to(PollingState::Idle);
  }
}

// ============================================================================
// PollingEngine
// ============================================================================

PollingEngine::PollingEngine(std::shared_ptr<NativeHandle> handle,
                             std::shared_ptr<ChangeNotifier> notifier,
                             const ClipboardOptions &options,
                             logging::Logger logger)
    : impl_(std::make_shared<Impl>()) {
  impl_->handle = std::move(handle);
  impl_->notifier = std::move(notifier);
  impl_->logger = logger ? std::move(logger) : logging::get();
  impl_->default_interval = options.polling_interval;
  impl_->enabled = options.change_detection_enabled;
}

PollingEngine::~PollingEngine() { close(); }

Result<PollingTask>
PollingEngine::start(std::optional<std::chrono::milliseconds> interval,
                     CancellationToken token) {
  if (!impl_->enabled) {
    impl_->logger->warn(
        "Polling requested but change detection is disabled in options");
    return PollingTask::completed();
  }

  auto period = interval.value_or(impl_->default_interval);
  CLIPSAFE_REQUIRE(period.count() > 0, ErrorCode::InvalidArgument,
                   "Polling interval must be greater than zero");

  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->closed.load()) {
    return Error(ErrorCode::Disposed, "Polling engine has been closed");
  }

  // The old run sees the cancel before its next native call; an iteration
  // already inside the library finishes on its own
  if (impl_->source) {
    impl_->source->cancel();
  }
  impl_->source = CancellationSource::linked(token);

  auto run = std::make_shared<RunState>();
  run->token = impl_->source->token();
  run->interval = period;
  run->generation = ++impl_->generation;
  PollingTask task(run->done.get_future().share());

  auto self = impl_;
  try {
    std::thread worker([self, run] {
      try {
        self->run_loop(*run);
      } catch (const std::exception &e) {
        self->logger->error("Unexpected error in clipboard polling: {}",
                            e.what());
      }
      self->finish(run->generation);
      run->done.set_value();
    });
    impl_->worker_id = worker.get_id();
    worker.detach();
  } catch (const std::system_error &e) {
    impl_->source->cancel();
    if (impl_->state.is_active()) {
      impl_->move_to(PollingState::Idle);
    }
    return Error(ErrorCode::PlatformError, "Failed to start polling worker",
                 e.what());
  }

  impl_->move_to(PollingState::Running);
  impl_->current_task = task;
  return task;
}

void PollingEngine::stop() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->source) {
    impl_->source->cancel();
  }
  if (impl_->state.current() == PollingState::Running) {
    impl_->move_to(PollingState::Stopping);
  }
}

bool PollingEngine::close(std::chrono::milliseconds grace) {
  PollingTask task;
  bool on_worker = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->closed.exchange(true)) {
      return true;
    }
    if (impl_->source) {
      impl_->source->cancel();
    }
    task = impl_->current_task;
    on_worker = impl_->worker_id == std::this_thread::get_id();
    impl_->move_to(PollingState::Closed);
  }

  bool exited = true;
  if (task.valid() && !task.is_complete()) {
    if (on_worker) {
      impl_->logger->debug("Closing from the polling worker, not waiting");
    } else {
      exited = task.wait_for(grace);
      if (!exited) {
        impl_->logger->warn(
            "Polling worker did not stop within {}ms, continuing shutdown",
            grace.count());
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->source) {
      impl_->source->dispose();
      impl_->source.reset();
    }
  }
  return exited;
}

PollingState PollingEngine::state() const { return impl_->state.current(); }

bool PollingEngine::is_running() const { return impl_->state.is_active(); }

} // namespace clipsafe
