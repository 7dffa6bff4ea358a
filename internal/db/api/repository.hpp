#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"

namespace eventlog::db {

/*
  Event log repository.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its own appends
  - AppendEvent assigns a position greater than every position already
    visible in the run
  - QueueNotification is delivered to channel listeners only after the
    transaction commits, and never if it rolls back

  The DB is the source of truth for event records; the notification channel
  only carries "{run_id}_{position}" pointers into it.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Sets record.position on success.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::optional<model::EventRecord> GetEventByPosition(Transaction&, uint64_t position) = 0;

  // Events of one run with position >= cursor, ascending.
  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& run_id, uint64_t cursor,
                                                     std::optional<uint64_t> max_events) = 0;

  virtual std::optional<uint64_t> GetMaxPosition(Transaction&, const std::string& run_id) = 0;

  virtual Result DeleteRun(Transaction&, const std::string& run_id) = 0;

  virtual Result Wipe(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Notifications
  // ---------------------------------------------------------------------

  virtual Result QueueNotification(Transaction&, const std::string& channel, const std::string& payload) = 0;
};

} // namespace eventlog::db
