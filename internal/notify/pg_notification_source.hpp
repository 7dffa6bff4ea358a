#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/notify/notification.hpp"

namespace eventlog::notify {

/*
  PgNotificationSource

  LISTEN on a Postgres channel through libpqxx.

  Design notes:
  -------------
  - Every Subscribe() opens its own dedicated connection; listening
    connections are never taken from the repository pool, since a pooled
    connection would carry the LISTEN to unrelated transactions.
  - Next() waits in pqxx::connection::await_notification for at most one
    poll interval, so the stop signal is observed at every boundary.
  - A broken connection ends the stream (fail-stop). Reconnecting is the
    consumer's decision.
  - Listening connections carry a connect_timeout (unless the conninfo
    already sets one), so a server that never answers turns into a
    TransportFailure instead of an unbounded Subscribe().
*/
class PgNotificationSource final : public NotificationSource {
 public:
  PgNotificationSource(std::string conninfo, std::chrono::milliseconds poll_interval,
                       std::chrono::seconds connect_timeout = std::chrono::seconds(5));

  std::unique_ptr<NotificationStream> Subscribe(const std::string& channel, std::shared_ptr<const StopSignal> stop) override;

 private:
  std::string               conninfo_;
  std::chrono::milliseconds poll_interval_;
};

// Adds connect_timeout to a URI or key=value conninfo that has none.
std::string WithConnectTimeout(const std::string& conninfo, std::chrono::seconds timeout);

} // namespace eventlog::notify
