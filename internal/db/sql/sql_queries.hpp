#pragma once

namespace eventlog::db::sql {

/*
  Canonical event log SQL for the SQLite backend.

  Postgres prepares its own dialect ($n placeholders, RETURNING, pg_notify)
  in PgPool::PrepareStatements.
*/

static constexpr const char* CREATE_EVENT_LOGS =
    "CREATE TABLE IF NOT EXISTS event_logs ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " run_id TEXT NOT NULL,"
    " event_type TEXT,"
    " timestamp_ms INTEGER NOT NULL,"
    " event TEXT NOT NULL);";

static constexpr const char* CREATE_EVENT_LOGS_RUN_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_event_logs_run_id ON event_logs(run_id, id);";

static constexpr const char* INSERT_EVENT =
    "INSERT INTO event_logs(run_id,event_type,timestamp_ms,event)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_EVENT_BY_ID =
    "SELECT id,run_id,event_type,timestamp_ms,event"
    " FROM event_logs WHERE id=?;";

static constexpr const char* SELECT_RUN_EVENTS =
    "SELECT id,run_id,event_type,timestamp_ms,event"
    " FROM event_logs WHERE run_id=? AND id>=?"
    " ORDER BY id ASC LIMIT ?;";

static constexpr const char* SELECT_RUN_MAX_ID =
    "SELECT MAX(id) FROM event_logs WHERE run_id=?;";

static constexpr const char* DELETE_RUN_EVENTS =
    "DELETE FROM event_logs WHERE run_id=?;";

static constexpr const char* DELETE_ALL_EVENTS =
    "DELETE FROM event_logs;";

}
