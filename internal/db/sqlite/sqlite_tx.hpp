#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/notify/local_hub.hpp"
#include "sqlite_db.hpp"

namespace eventlog::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Queued notifications are published to the hub after COMMIT succeeds.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::shared_ptr<notify::LocalNotificationHub> hub);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Queue(std::string channel, std::string payload) {
    notifications_.emplace_back(std::move(channel), std::move(payload));
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::shared_ptr<notify::LocalNotificationHub> hub_;
  std::unique_lock<std::mutex> lock_;
  std::vector<std::pair<std::string, std::string>> notifications_;
  bool committed_ = false;
  bool finished_  = false;
};

}
