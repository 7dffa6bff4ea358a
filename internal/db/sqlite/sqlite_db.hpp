#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace eventlog::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The handle is opened FULLMUTEX, but a transaction spans several calls, so
  SqliteTransaction also holds TxMutex() for its whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  // Create the event_logs table and indexes if missing.
  void Bootstrap();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace eventlog::db::sqlite
