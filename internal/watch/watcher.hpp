#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/notify/notification.hpp"
#include "internal/notify/stop_signal.hpp"
#include "record_fetcher.hpp"
#include "subscriber_registry.hpp"
#include "watch_loop.hpp"

namespace eventlog::watch {

enum class WatcherState {
  kIdle,    // no loop yet
  kRunning, // loop started by the first Watch()
  kClosing, // stop signalled, join in progress
  kStopped, // loop joined
};

const char* ToString(WatcherState state);

/*
  Watcher

  Facade over one WatchLoop thread.

  Lifecycle:
    Idle -> Running     first Watch(); exactly one loop even under
                        concurrent first calls. The channel is subscribed
                        before Watch() returns.
    Running -> Closing -> Stopped
                        Close()
  There is no way back to Idle: the loop keeps running with an empty
  registry until Close(). Watch() after Close() throws util::InvalidState.

  Callbacks run on the loop thread. They may call Watch()/Unwatch() but
  not Close(), which would have to join the thread it runs on.
*/
class Watcher {
 public:
  Watcher(std::shared_ptr<notify::NotificationSource> source, std::shared_ptr<RecordFetcher> fetcher, WatchLoopOptions options);
  ~Watcher();

  Watcher(const Watcher&)            = delete;
  Watcher& operator=(const Watcher&) = delete;

  void Watch(const std::string& stream_id, uint64_t cursor, CallbackPtr callback);

  // No-op for an unknown stream or callback. Never stops the loop.
  void Unwatch(const std::string& stream_id, const CallbackPtr& callback);

  // Signals the loop and blocks until it has exited (at most about one poll
  // interval). Idempotent; a no-op when Watch() was never called.
  void Close();

  bool         IsWatching(const std::string& stream_id) const;
  WatcherState State() const;

  // False once the loop thread has exited, including after a transport
  // failure that reconnecting did not recover.
  bool LoopAlive() const;

  const SubscriberRegistry& Registry() const {
    return *registry_;
  }

 private:
  void StartLoopLocked();

  std::shared_ptr<notify::NotificationSource> source_;
  std::shared_ptr<RecordFetcher>              fetcher_;
  WatchLoopOptions                            options_;
  std::shared_ptr<SubscriberRegistry>         registry_;

  mutable std::mutex                 lifecycle_mutex_;
  std::condition_variable            stopped_cv_;
  WatcherState                       state_ = WatcherState::kIdle;
  std::shared_ptr<notify::StopSignal> stop_;
  std::thread                        loop_thread_;
  std::thread::id                    loop_thread_id_;
  std::shared_ptr<std::atomic<bool>> loop_alive_;
};

} // namespace eventlog::watch
