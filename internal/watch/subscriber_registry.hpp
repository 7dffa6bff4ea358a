#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/event_record.hpp"

namespace eventlog::watch {

using EventCallback = std::function<void(const db::model::EventRecord&)>;

// Callback identity is the address of the shared object: the same
// CallbackPtr passed to Watch() must be passed to Unwatch().
using CallbackPtr = std::shared_ptr<const EventCallback>;

inline CallbackPtr MakeCallback(EventCallback fn) {
  return std::make_shared<const EventCallback>(std::move(fn));
}

struct Subscription {
  uint64_t    cursor = 0; // deliver positions >= cursor
  CallbackPtr callback;
};

/*
  SubscriberRegistry

  stream id -> subscriptions in registration order.

  Shared by the watcher facade (writes, from caller threads) and the watch
  loop (snapshots, from the loop thread). One mutex guards the map and every
  list; it is held for in-memory work only, never across a fetch or a
  callback.
*/
class SubscriberRegistry {
 public:
  void Add(const std::string& stream_id, uint64_t cursor, CallbackPtr callback);

  // Removes every subscription of callback under stream_id and drops the
  // stream when its list empties. Returns false when nothing matched.
  bool Remove(const std::string& stream_id, const CallbackPtr& callback);

  bool Has(const std::string& stream_id) const;

  // Copy of the current list; empty when the stream is not watched.
  std::vector<Subscription> Snapshot(const std::string& stream_id) const;

  std::size_t StreamCount() const;
  std::size_t SubscriptionCount() const;

 private:
  mutable std::mutex                                         mutex_;
  std::unordered_map<std::string, std::vector<Subscription>> subscriptions_;
};

} // namespace eventlog::watch
