#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/notify/stop_signal.hpp"

namespace eventlog::notify {

/*
  One item read from a notification channel: either a raw payload or a
  marker saying nothing arrived within the poll interval.
*/
struct Notification {
  enum class Kind {
    kPayload,
    kTimeout,
  };

  Kind        kind = Kind::kTimeout;
  std::string payload;

  static Notification Payload(std::string payload) {
    return {Kind::kPayload, std::move(payload)};
  }

  static Notification Timeout() {
    return {Kind::kTimeout, {}};
  }

  bool IsTimeout() const {
    return kind == Kind::kTimeout;
  }
};

/*
  Lazy, unbounded sequence of notifications for one channel.

  Next() blocks for at most one poll interval and returns a timeout marker
  when the interval passes quietly. It returns std::nullopt once the
  sequence has ended: the stop signal was raised, or the transport failed
  and cannot continue. A stream never throws for an empty interval.

  A stream is consumed by a single thread.
*/
class NotificationStream {
 public:
  virtual ~NotificationStream() = default;

  virtual std::optional<Notification> Next() = 0;
};

/*
  Publish/subscribe primitive of the backing store.

  Subscribe() throws util::TransportFailure when the channel cannot be
  listened on at all. Each call yields an independent stream, so a
  consumer whose stream ended can subscribe again.
*/
class NotificationSource {
 public:
  virtual ~NotificationSource() = default;

  virtual std::unique_ptr<NotificationStream> Subscribe(const std::string& channel, std::shared_ptr<const StopSignal> stop) = 0;
};

} // namespace eventlog::notify
