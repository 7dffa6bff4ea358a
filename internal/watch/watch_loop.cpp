#include "watch_loop.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "internal/notify/wire.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace eventlog::watch {

using eventlog::observability::BoolField;
using eventlog::observability::IntField;
using eventlog::observability::Metrics;
using eventlog::observability::StringField;

WatchLoop::WatchLoop(std::shared_ptr<notify::NotificationSource> source, std::shared_ptr<SubscriberRegistry> registry,
                     std::shared_ptr<RecordFetcher> fetcher, WatchLoopOptions options, std::shared_ptr<const notify::StopSignal> stop)
    : source_(std::move(source)),
      registry_(std::move(registry)),
      fetcher_(std::move(fetcher)),
      options_(std::move(options)),
      stop_(std::move(stop)) {
}

void WatchLoop::Run() {
  Run(Listen());
}

std::unique_ptr<notify::NotificationStream> WatchLoop::Listen() {
  try {
    return source_->Subscribe(options_.channel, stop_);
  } catch (const util::TransportFailure& e) {
    EVENTLOG_LOG_ERROR("watch loop could not listen", {StringField("channel", options_.channel), StringField("error", e.what())});
  }
  return nullptr;
}

void WatchLoop::Run(std::unique_ptr<notify::NotificationStream> stream) {
  const auto& reconnect = options_.reconnect;
  auto        backoff   = reconnect.initial_backoff;
  uint32_t    attempts  = 0;
  bool        first     = true;

  while (!stop_->IsSet()) {
    if (!first) {
      stream = Listen();
    }
    first = false;

    if (stream) {
      if (attempts > 0) {
        Metrics::Instance().RecordReconnect(true);
      }
      attempts = 0;
      backoff  = reconnect.initial_backoff;

      EVENTLOG_LOG_INFO("watch loop listening", {StringField("channel", options_.channel)});
      if (Consume(*stream)) {
        break;
      }
      EVENTLOG_LOG_ERROR("notification stream ended; watches receive no further events",
                         {StringField("channel", options_.channel), BoolField("reconnect", reconnect.enabled)});
      stream.reset();
    } else if (attempts > 0) {
      Metrics::Instance().RecordReconnect(false);
    }

    if (!reconnect.enabled) {
      break;
    }

    ++attempts;
    if (reconnect.max_attempts > 0 && attempts > reconnect.max_attempts) {
      EVENTLOG_LOG_ERROR("watch loop giving up after reconnect attempts", {IntField("attempts", reconnect.max_attempts)});
      break;
    }

    EVENTLOG_LOG_WARN("watch loop reconnecting",
                      {IntField("attempt", attempts), IntField("backoff_ms", static_cast<int64_t>(backoff.count()))});
    if (stop_->WaitFor(backoff)) {
      break;
    }
    backoff = std::min(backoff * 2, reconnect.max_backoff);
  }

  EVENTLOG_LOG_INFO("watch loop exited", {StringField("channel", options_.channel), BoolField("stopped", stop_->IsSet())});
}

bool WatchLoop::Consume(notify::NotificationStream& stream) {
  while (auto item = stream.Next()) {
    if (item->IsTimeout()) {
      if (stop_->IsSet()) {
        return true;
      }
      continue;
    }
    HandlePayload(item->payload);
  }
  return stop_->IsSet();
}

DispatchOutcome WatchLoop::HandlePayload(std::string_view payload) {
  auto raw = notify::ParsePayload(payload);
  if (!raw) {
    EVENTLOG_LOG_DEBUG("discarding malformed notification", {StringField("payload", payload)});
    Metrics::Instance().RecordNotification("malformed");
    return DispatchOutcome::kMalformed;
  }

  const auto subscriptions = registry_->Snapshot(raw->stream_id);
  if (subscriptions.empty()) {
    Metrics::Instance().RecordNotification("unwatched");
    return DispatchOutcome::kUnwatched;
  }

  std::optional<db::model::EventRecord> record;
  const auto                            started_at = std::chrono::steady_clock::now();
  try {
    record = fetcher_->Fetch(raw->stream_id, raw->position);
  } catch (const std::exception& e) {
    EVENTLOG_LOG_WARN("record fetch failed; notification skipped",
                      {StringField("stream_id", raw->stream_id), IntField("position", static_cast<int64_t>(raw->position)),
                       StringField("error", e.what())});
    Metrics::Instance().RecordNotification("fetch_error");
    return DispatchOutcome::kFetchError;
  }
  Metrics::Instance().ObserveFetchLatencyMs(
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  if (!record) {
    EVENTLOG_LOG_DEBUG("notified record not visible", {StringField("stream_id", raw->stream_id),
                                                       IntField("position", static_cast<int64_t>(raw->position))});
    Metrics::Instance().RecordNotification("not_found");
    return DispatchOutcome::kNotFound;
  }

  uint64_t delivered = 0;
  for (const auto& subscription : subscriptions) {
    if (subscription.cursor > raw->position) {
      continue;
    }

    try {
      (*subscription.callback)(*record);
      ++delivered;
    } catch (const std::exception& e) {
      EVENTLOG_LOG_ERROR("watch callback threw", {StringField("stream_id", raw->stream_id),
                                                  IntField("position", static_cast<int64_t>(raw->position)),
                                                  StringField("error", e.what())});
      Metrics::Instance().RecordCallbackFailure();
    } catch (...) {
      EVENTLOG_LOG_ERROR("watch callback threw a non-standard exception",
                         {StringField("stream_id", raw->stream_id), IntField("position", static_cast<int64_t>(raw->position))});
      Metrics::Instance().RecordCallbackFailure();
    }
  }

  Metrics::Instance().RecordDeliveries(delivered);
  Metrics::Instance().RecordNotification("dispatched");
  return DispatchOutcome::kDispatched;
}

} // namespace eventlog::watch
