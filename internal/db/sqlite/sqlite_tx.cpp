#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace eventlog::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::shared_ptr<notify::LocalNotificationHub> hub)
    : db_(std::move(db)), hub_(std::move(hub)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      EVENTLOG_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();

  if (hub_) {
    for (const auto& [channel, payload] : notifications_) {
      hub_->Publish(channel, payload);
    }
  }
  notifications_.clear();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
  notifications_.clear();
  lock_.unlock();
}

} // namespace eventlog::db::sqlite
