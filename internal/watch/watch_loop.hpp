#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/notify/notification.hpp"
#include "internal/notify/stop_signal.hpp"
#include "record_fetcher.hpp"
#include "subscriber_registry.hpp"

namespace eventlog::watch {

struct ReconnectOptions {
  bool                      enabled      = false;
  uint32_t                  max_attempts = 0; // 0 = unbounded
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{5000};
};

struct WatchLoopOptions {
  std::string      channel = "run_events";
  ReconnectOptions reconnect;
};

enum class DispatchOutcome {
  kDispatched, // record fetched and offered to every subscription
  kMalformed,
  kUnwatched,
  kNotFound,
  kFetchError,
};

/*
  WatchLoop

  The single consumer of a notification channel for one Watcher.

  Per payload: decode "{stream_id}_{position}", snapshot the stream's
  subscriptions, fetch the record once, then invoke each subscription whose
  cursor <= position, in registration order, on the loop thread. A
  notification is fully handled before the next is read, so every subscriber
  of a stream sees non-decreasing positions.

  Run() returns when the stop signal is observed at a timeout boundary, or
  when the stream ends and reconnecting is disabled or exhausted.

  Listen() is the subscribe step on its own. A caller that must not miss
  notifications published right after it returns (Watcher) listens on its
  own thread and hands the stream to Run(stream). A null stream counts as
  a failed first attempt.
*/
class WatchLoop {
 public:
  WatchLoop(std::shared_ptr<notify::NotificationSource> source, std::shared_ptr<SubscriberRegistry> registry,
            std::shared_ptr<RecordFetcher> fetcher, WatchLoopOptions options, std::shared_ptr<const notify::StopSignal> stop);

  void Run();
  void Run(std::unique_ptr<notify::NotificationStream> stream);

  // Subscribes to the channel. Returns nullptr (logged) on transport failure.
  std::unique_ptr<notify::NotificationStream> Listen();

  DispatchOutcome HandlePayload(std::string_view payload);

 private:
  // Reads the stream until it ends. Returns true if the stop was observed.
  bool Consume(notify::NotificationStream& stream);

  std::shared_ptr<notify::NotificationSource> source_;
  std::shared_ptr<SubscriberRegistry>         registry_;
  std::shared_ptr<RecordFetcher>              fetcher_;
  WatchLoopOptions                            options_;
  std::shared_ptr<const notify::StopSignal>   stop_;
};

} // namespace eventlog::watch
