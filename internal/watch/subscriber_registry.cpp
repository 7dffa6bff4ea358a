#include "subscriber_registry.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace eventlog::watch {

void SubscriberRegistry::Add(const std::string& stream_id, uint64_t cursor, CallbackPtr callback) {
  if (!callback || !*callback) {
    throw util::InvalidArgument("watch: callback is empty; pass a callable created with MakeCallback");
  }

  std::lock_guard lock(mutex_);
  subscriptions_[stream_id].push_back(Subscription{cursor, std::move(callback)});
}

bool SubscriberRegistry::Remove(const std::string& stream_id, const CallbackPtr& callback) {
  std::lock_guard lock(mutex_);

  auto it = subscriptions_.find(stream_id);
  if (it == subscriptions_.end()) {
    return false;
  }

  auto&      list    = it->second;
  const auto removed = std::erase_if(list, [&](const Subscription& sub) { return sub.callback == callback; });
  if (list.empty()) {
    subscriptions_.erase(it);
  }
  return removed > 0;
}

bool SubscriberRegistry::Has(const std::string& stream_id) const {
  std::lock_guard lock(mutex_);
  return subscriptions_.contains(stream_id);
}

std::vector<Subscription> SubscriberRegistry::Snapshot(const std::string& stream_id) const {
  std::lock_guard lock(mutex_);

  auto it = subscriptions_.find(stream_id);
  if (it == subscriptions_.end()) {
    return {};
  }
  return it->second;
}

std::size_t SubscriberRegistry::StreamCount() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

std::size_t SubscriberRegistry::SubscriptionCount() const {
  std::lock_guard lock(mutex_);
  std::size_t total = 0;
  for (const auto& [_, list] : subscriptions_) {
    total += list.size();
  }
  return total;
}

} // namespace eventlog::watch
