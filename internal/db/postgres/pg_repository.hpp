#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace eventlog::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> GetEventByPosition(Transaction&, uint64_t position) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& run_id, uint64_t cursor,
                                             std::optional<uint64_t> max_events) override;
  std::optional<uint64_t> GetMaxPosition(Transaction&, const std::string& run_id) override;
  Result DeleteRun(Transaction&, const std::string& run_id) override;
  Result Wipe(Transaction&) override;

  // SELECT pg_notify() inside the transaction: delivered on commit only.
  Result QueueNotification(Transaction&, const std::string& channel, const std::string& payload) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
