#include "pg_pool.hpp"

namespace eventlog::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (!conn->is_open()) {
          --live_connections_;
          continue;
        }
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::Bootstrap() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS event_logs (id BIGSERIAL PRIMARY KEY, run_id TEXT NOT NULL, event_type TEXT, timestamp_ms BIGINT NOT NULL, event TEXT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_event_logs_run_id ON event_logs(run_id, id);");

  tx.exec("SELECT id,run_id,event_type,timestamp_ms,event FROM event_logs LIMIT 1;");
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_event",
               "INSERT INTO event_logs(run_id,event_type,timestamp_ms,event) "
               "VALUES($1,$2,$3,$4) RETURNING id");

  conn.prepare("get_event",
               "SELECT id,run_id,event_type,timestamp_ms,event "
               "FROM event_logs WHERE id=$1");

  conn.prepare("read_run_events",
               "SELECT id,run_id,event_type,timestamp_ms,event "
               "FROM event_logs WHERE run_id=$1 AND id>=$2 ORDER BY id ASC LIMIT $3");

  conn.prepare("max_run_position", "SELECT MAX(id) FROM event_logs WHERE run_id=$1");

  conn.prepare("delete_run", "DELETE FROM event_logs WHERE run_id=$1");

  // delivered by the server only when the enclosing transaction commits
  conn.prepare("notify", "SELECT pg_notify($1,$2)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace eventlog::db::postgres
