#include "pg_notification_source.hpp"

#include <pqxx/pqxx>

#include <ctime>
#include <deque>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eventlog::notify {

namespace {

using eventlog::observability::StringField;

class PayloadReceiver final : public pqxx::notification_receiver {
 public:
  PayloadReceiver(pqxx::connection& conn, const std::string& channel, std::deque<std::string>& pending)
      : pqxx::notification_receiver(conn, channel), pending_(pending) {
  }

  void operator()(const std::string& payload, int) override {
    pending_.push_back(payload);
  }

 private:
  std::deque<std::string>& pending_;
};

class PgNotificationStream final : public NotificationStream {
 public:
  PgNotificationStream(std::unique_ptr<pqxx::connection> conn, const std::string& channel, std::shared_ptr<const StopSignal> stop,
                       std::chrono::milliseconds poll_interval)
      : conn_(std::move(conn)),
        receiver_(std::make_unique<PayloadReceiver>(*conn_, channel, pending_)),
        channel_(channel),
        stop_(std::move(stop)),
        poll_interval_(poll_interval) {
  }

  ~PgNotificationStream() override {
    // receiver must unregister (UNLISTEN) before its connection goes away
    receiver_.reset();
  }

  std::optional<Notification> Next() override {
    if (stop_->IsSet() || broken_) {
      return std::nullopt;
    }

    if (pending_.empty()) {
      const auto seconds      = std::chrono::duration_cast<std::chrono::seconds>(poll_interval_);
      const auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(poll_interval_ - seconds);
      try {
        conn_->await_notification(static_cast<std::time_t>(seconds.count()), static_cast<long>(microseconds.count()));
      } catch (const pqxx::broken_connection& e) {
        EVENTLOG_LOG_ERROR("notification connection lost", {StringField("channel", channel_), StringField("error", e.what())});
        broken_ = true;
        return std::nullopt;
      } catch (const pqxx::failure& e) {
        EVENTLOG_LOG_ERROR("notification wait failed", {StringField("channel", channel_), StringField("error", e.what())});
        broken_ = true;
        return std::nullopt;
      }
    }

    if (pending_.empty()) {
      return Notification::Timeout();
    }

    auto payload = std::move(pending_.front());
    pending_.pop_front();
    return Notification::Payload(std::move(payload));
  }

 private:
  std::unique_ptr<pqxx::connection> conn_;
  std::deque<std::string>           pending_;
  std::unique_ptr<PayloadReceiver>  receiver_;
  std::string                       channel_;
  std::shared_ptr<const StopSignal> stop_;
  std::chrono::milliseconds         poll_interval_;
  bool                              broken_ = false;
};

} // namespace

std::string WithConnectTimeout(const std::string& conninfo, std::chrono::seconds timeout) {
  if (conninfo.find("connect_timeout") != std::string::npos) {
    return conninfo;
  }

  const auto setting = "connect_timeout=" + std::to_string(timeout.count());
  if (conninfo.rfind("postgresql://", 0) == 0 || conninfo.rfind("postgres://", 0) == 0) {
    return conninfo + (conninfo.find('?') == std::string::npos ? "?" : "&") + setting;
  }
  return conninfo.empty() ? setting : conninfo + " " + setting;
}

PgNotificationSource::PgNotificationSource(std::string conninfo, std::chrono::milliseconds poll_interval, std::chrono::seconds connect_timeout)
    : conninfo_(WithConnectTimeout(conninfo, connect_timeout)), poll_interval_(poll_interval) {
}

std::unique_ptr<NotificationStream> PgNotificationSource::Subscribe(const std::string& channel, std::shared_ptr<const StopSignal> stop) {
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    return std::make_unique<PgNotificationStream>(std::move(conn), channel, std::move(stop), poll_interval_);
  } catch (const pqxx::failure& e) {
    throw util::TransportFailure("listen on '" + channel + "' failed: " + e.what());
  }
}

} // namespace eventlog::notify
