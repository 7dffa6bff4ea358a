#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "internal/notify/local_hub.hpp"

namespace eventlog::db::memory {

class MemoryTransaction;

/*
  In-memory event log.

  Positions come from a process-wide counter, like a Postgres sequence:
  they are handed out at append time and a rolled back append leaves a gap.
  Notifications go to the optional hub once the transaction commits.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::shared_ptr<notify::LocalNotificationHub> hub = nullptr);

  std::unique_ptr<Transaction> Begin() override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> GetEventByPosition(Transaction&, uint64_t position) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& run_id, uint64_t cursor,
                                             std::optional<uint64_t> max_events) override;
  std::optional<uint64_t> GetMaxPosition(Transaction&, const std::string& run_id) override;
  Result DeleteRun(Transaction&, const std::string& run_id) override;
  Result Wipe(Transaction&) override;

  Result QueueNotification(Transaction&, const std::string& channel, const std::string& payload) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::EventRecord> events;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;

  std::atomic<uint64_t> next_position_{1};
  std::shared_ptr<notify::LocalNotificationHub> hub_;
};

} // namespace eventlog::db::memory
