#include "local_hub.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace eventlog::notify {

class LocalNotificationHub::Stream final : public NotificationStream {
 public:
  Stream(std::shared_ptr<Listener> listener, std::shared_ptr<const StopSignal> stop, std::chrono::milliseconds poll_interval)
      : listener_(std::move(listener)), stop_(std::move(stop)), poll_interval_(poll_interval) {
  }

  std::optional<Notification> Next() override {
    if (stop_->IsSet()) {
      return std::nullopt;
    }

    std::unique_lock lock(listener_->mutex);
    listener_->cv.wait_for(lock, poll_interval_, [this] { return listener_->disconnected || !listener_->pending.empty(); });

    if (listener_->disconnected) {
      return std::nullopt;
    }

    if (listener_->pending.empty()) {
      return Notification::Timeout();
    }

    auto payload = std::move(listener_->pending.front());
    listener_->pending.pop_front();
    return Notification::Payload(std::move(payload));
  }

 private:
  std::shared_ptr<Listener>         listener_;
  std::shared_ptr<const StopSignal> stop_;
  std::chrono::milliseconds         poll_interval_;
};

LocalNotificationHub::LocalNotificationHub(std::chrono::milliseconds poll_interval) : poll_interval_(poll_interval) {
}

std::unique_ptr<NotificationStream> LocalNotificationHub::Subscribe(const std::string& channel, std::shared_ptr<const StopSignal> stop) {
  auto listener     = std::make_shared<Listener>();
  listener->channel = channel;

  {
    std::lock_guard lock(mutex_);
    if (!available_) {
      throw util::TransportFailure("local channel unavailable: cannot listen on '" + channel + "'");
    }
    listeners_.push_back(listener);
  }

  return std::make_unique<Stream>(std::move(listener), std::move(stop), poll_interval_);
}

void LocalNotificationHub::Publish(const std::string& channel, const std::string& payload) {
  std::vector<std::shared_ptr<Listener>> targets;
  {
    std::lock_guard lock(mutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(), [](const auto& weak) { return weak.expired(); }), listeners_.end());
    for (const auto& weak : listeners_) {
      auto listener = weak.lock();
      if (listener && listener->channel == channel) {
        targets.push_back(std::move(listener));
      }
    }
  }

  for (const auto& listener : targets) {
    {
      std::lock_guard lock(listener->mutex);
      listener->pending.push_back(payload);
    }
    listener->cv.notify_one();
  }
}

void LocalNotificationHub::Disconnect() {
  std::vector<std::weak_ptr<Listener>> dropped;
  {
    std::lock_guard lock(mutex_);
    dropped.swap(listeners_);
  }

  for (const auto& weak : dropped) {
    if (auto listener = weak.lock()) {
      {
        std::lock_guard lock(listener->mutex);
        listener->disconnected = true;
        listener->pending.clear();
      }
      listener->cv.notify_all();
    }
  }
}

void LocalNotificationHub::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

std::size_t LocalNotificationHub::ListenerCount(const std::string& channel) {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(std::count_if(listeners_.begin(), listeners_.end(), [&](const auto& weak) {
    auto listener = weak.lock();
    return listener && listener->channel == channel;
  }));
}

} // namespace eventlog::notify
