#include "memory_repository.hpp"

#include <chrono>

#include "memory_tx.hpp"

namespace eventlog::db::memory {

namespace {

int64_t NowMs() {
  return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

MemoryRepository::MemoryRepository(std::shared_ptr<notify::LocalNotificationHub> hub) : hub_(std::move(hub)) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  if (r.run_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "run_id is required");

  auto& s    = TX(t).Mutable();
  r.position = next_position_.fetch_add(1);
  if (r.timestamp_ms == 0) r.timestamp_ms = NowMs();
  s.events[r.position] = r;
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEventByPosition(Transaction& t, uint64_t position) {
  return TX(t).Read([position](const State& s) -> std::optional<model::EventRecord> {
    auto it = s.events.find(position);
    if (it == s.events.end()) return std::nullopt;
    return it->second;
  });
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t cursor,
                                                             std::optional<uint64_t> max_events) {
  return TX(t).Read([&](const State& s) {
    std::vector<model::EventRecord> out;
    for (auto it = s.events.lower_bound(cursor); it != s.events.end(); ++it) {
      if (max_events && out.size() >= *max_events) break;
      if (it->second.run_id == run_id) out.push_back(it->second);
    }
    return out;
  });
}

std::optional<uint64_t> MemoryRepository::GetMaxPosition(Transaction& t, const std::string& run_id) {
  return TX(t).Read([&](const State& s) -> std::optional<uint64_t> {
    for (auto it = s.events.rbegin(); it != s.events.rend(); ++it) {
      if (it->second.run_id == run_id) return it->first;
    }
    return std::nullopt;
  });
}

Result MemoryRepository::DeleteRun(Transaction& t, const std::string& run_id) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.events, [&](const auto& entry) { return entry.second.run_id == run_id; });
  return Result::Ok();
}

Result MemoryRepository::Wipe(Transaction& t) {
  TX(t).Mutable().events.clear();
  return Result::Ok();
}

Result MemoryRepository::QueueNotification(Transaction& t, const std::string& channel, const std::string& payload) {
  TX(t).Queue(channel, payload);
  return Result::Ok();
}

} // namespace eventlog::db::memory
