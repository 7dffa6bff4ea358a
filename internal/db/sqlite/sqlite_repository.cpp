#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <chrono>

#include "internal/db/sql/sql_queries.hpp"

namespace eventlog::db::sqlite {

using eventlog::db::ErrorCode;
using eventlog::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static model::EventRecord ReadRow(sqlite3_stmt* st) {
    model::EventRecord r;
    r.position = ColU64(st, 0);
    r.run_id = ColText(st, 1);
    r.event_type = ColText(st, 2);
    r.timestamp_ms = ColI64(st, 3);
    r.body = ColText(st, 4);
    return r;
}

static int64_t NowMs() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::system_clock::now().time_since_epoch())
                                    .count());
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<notify::LocalNotificationHub> hub)
    : db_(std::move(db)), hub_(std::move(hub)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, hub_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    if (r.run_id.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "run_id is required");
    if (r.timestamp_ms == 0)
        r.timestamp_ms = NowMs();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_EVENT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.run_id);
    BindText(st, 2, r.event_type);
    BindI64(st, 3, r.timestamp_ms);
    BindText(st, 4, r.body);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result)
        r.position = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::EventRecord>
SqliteRepository::GetEventByPosition(Transaction& t, uint64_t position) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_EVENT_BY_ID, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindU64(st, 1, position);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadRow(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::EventRecord>
SqliteRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t cursor,
                             std::optional<uint64_t> max_events) {
    auto* db = TX(t).Handle();
    std::vector<model::EventRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_RUN_EVENTS, -1, &st, nullptr) != SQLITE_OK)
        return out;

    // LIMIT -1 means unbounded in sqlite
    BindText(st, 1, run_id);
    BindU64(st, 2, cursor);
    BindI64(st, 3, max_events ? static_cast<int64_t>(*max_events) : -1);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::optional<uint64_t> SqliteRepository::GetMaxPosition(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_RUN_MAX_ID, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, run_id);

    std::optional<uint64_t> out;
    if (sqlite3_step(st) == SQLITE_ROW && sqlite3_column_type(st, 0) != SQLITE_NULL)
        out = ColU64(st, 0);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteRun(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_RUN_EVENTS, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, run_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

Result SqliteRepository::Wipe(Transaction& t) {
    auto* db = TX(t).Handle();
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql::DELETE_ALL_EVENTS, nullptr, nullptr, &err);
    sqlite3_free(err);
    return Translate(db, rc);
}

Result SqliteRepository::QueueNotification(Transaction& t, const std::string& channel, const std::string& payload) {
    TX(t).Queue(channel, payload);
    return Result::Ok();
}

}
