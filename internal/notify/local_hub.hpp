#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/notify/notification.hpp"

namespace eventlog::notify {

/*
  LocalNotificationHub

  In-process stand-in for the store's channel, used by the memory and
  SQLite event stores (which have no LISTEN/NOTIFY of their own).

  Semantics mirror Postgres:
  - Publish() reaches every stream subscribed to that channel at the time
    of the call; earlier or later subscribers see nothing.
  - Payloads are delivered in publish order per stream.
  - Disconnect() ends every open stream, as a dropped connection would.
    SetAvailable(false) makes Subscribe() fail until re-enabled.
*/
class LocalNotificationHub final : public NotificationSource {
 public:
  explicit LocalNotificationHub(std::chrono::milliseconds poll_interval);

  std::unique_ptr<NotificationStream> Subscribe(const std::string& channel, std::shared_ptr<const StopSignal> stop) override;

  void Publish(const std::string& channel, const std::string& payload);

  void Disconnect();
  void SetAvailable(bool available);

  std::size_t ListenerCount(const std::string& channel);

 private:
  struct Listener {
    std::string             channel;
    std::mutex              mutex;
    std::condition_variable cv;
    std::deque<std::string> pending;
    bool                    disconnected = false;
  };

  class Stream;

  std::chrono::milliseconds poll_interval_;

  std::mutex                           mutex_;
  std::vector<std::weak_ptr<Listener>> listeners_;
  bool                                 available_ = true;
};

} // namespace eventlog::notify
