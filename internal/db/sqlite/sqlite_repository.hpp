#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/notify/local_hub.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace eventlog::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<notify::LocalNotificationHub> hub = nullptr);

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
  std::shared_ptr<SqliteDB> db_;
  std::shared_ptr<notify::LocalNotificationHub> hub_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
