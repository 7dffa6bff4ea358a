#include "watcher.hpp"

#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eventlog::watch {

using eventlog::observability::StringField;

const char* ToString(WatcherState state) {
  switch (state) {
    case WatcherState::kIdle:
      return "idle";
    case WatcherState::kRunning:
      return "running";
    case WatcherState::kClosing:
      return "closing";
    case WatcherState::kStopped:
      return "stopped";
  }
  return "unknown";
}

Watcher::Watcher(std::shared_ptr<notify::NotificationSource> source, std::shared_ptr<RecordFetcher> fetcher, WatchLoopOptions options)
    : source_(std::move(source)),
      fetcher_(std::move(fetcher)),
      options_(std::move(options)),
      registry_(std::make_shared<SubscriberRegistry>()),
      loop_alive_(std::make_shared<std::atomic<bool>>(false)) {
  if (!source_ || !fetcher_) {
    throw util::InvalidArgument("watcher: notification source and record fetcher are required");
  }
}

Watcher::~Watcher() {
  try {
    Close();
  } catch (const std::exception& e) {
    EVENTLOG_LOG_ERROR("watcher destroyed without a clean close", {StringField("error", e.what())});
    if (loop_thread_.joinable()) {
      stop_->Set();
      loop_thread_.detach();
    }
  }
}

void Watcher::Watch(const std::string& stream_id, uint64_t cursor, CallbackPtr callback) {
  std::lock_guard lock(lifecycle_mutex_);

  if (state_ == WatcherState::kClosing || state_ == WatcherState::kStopped) {
    throw util::InvalidState(std::string("watch: watcher is ") + ToString(state_) + "; create a new watcher to resume watching");
  }
  if (!callback) {
    throw util::InvalidArgument("watch: callback is empty; pass a callable created with MakeCallback");
  }

  if (state_ == WatcherState::kIdle) {
    StartLoopLocked();
  }

  registry_->Add(stream_id, cursor, std::move(callback));
}

void Watcher::StartLoopLocked() {
  stop_     = std::make_shared<notify::StopSignal>();
  auto loop = std::make_shared<WatchLoop>(source_, registry_, fetcher_, options_, stop_);

  // listening before Watch() returns, so nothing published after it is missed
  auto stream = loop->Listen();

  loop_alive_->store(true);
  try {
    loop_thread_ = std::thread([loop, alive = loop_alive_, stream = std::move(stream)]() mutable {
      try {
        loop->Run(std::move(stream));
      } catch (const std::exception& e) {
        EVENTLOG_LOG_ERROR("watch loop terminated by exception", {StringField("error", e.what())});
      }
      alive->store(false);
    });
  } catch (...) {
    loop_alive_->store(false);
    throw;
  }

  loop_thread_id_ = loop_thread_.get_id();
  state_          = WatcherState::kRunning;
  EVENTLOG_LOG_INFO("watcher started", {StringField("channel", options_.channel), StringField("state", ToString(state_))});
}

void Watcher::Unwatch(const std::string& stream_id, const CallbackPtr& callback) {
  registry_->Remove(stream_id, callback);
}

void Watcher::Close() {
  std::thread to_join;
  {
    std::unique_lock lock(lifecycle_mutex_);

    if (state_ == WatcherState::kIdle || state_ == WatcherState::kStopped) {
      return;
    }

    if (std::this_thread::get_id() == loop_thread_id_) {
      throw util::InvalidState("close: called from a watch callback; close the watcher from another thread");
    }

    if (state_ == WatcherState::kClosing) {
      stopped_cv_.wait(lock, [this] { return state_ == WatcherState::kStopped; });
      return;
    }

    state_ = WatcherState::kClosing;
    stop_->Set();
    to_join = std::move(loop_thread_);
  }

  // joined without the lock: callbacks may still call Watch()/Unwatch()
  if (to_join.joinable()) {
    to_join.join();
  }

  {
    std::lock_guard lock(lifecycle_mutex_);
    state_ = WatcherState::kStopped;
  }
  stopped_cv_.notify_all();
  EVENTLOG_LOG_INFO("watcher closed", {StringField("channel", options_.channel), StringField("state", ToString(WatcherState::kStopped))});
}

bool Watcher::IsWatching(const std::string& stream_id) const {
  return registry_->Has(stream_id);
}

WatcherState Watcher::State() const {
  std::lock_guard lock(lifecycle_mutex_);
  return state_;
}

bool Watcher::LoopAlive() const {
  return loop_alive_->load();
}

} // namespace eventlog::watch
