#include "pg_repository.hpp"

#include <chrono>

namespace eventlog::db::postgres {

namespace {

int64_t NowMs() {
  return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

model::EventRecord ReadRow(const pqxx::row& row) {
  model::EventRecord r;
  r.position     = row[0].as<uint64_t>();
  r.run_id       = row[1].c_str();
  r.event_type   = row[2].is_null() ? std::string{} : row[2].as<std::string>();
  r.timestamp_ms = row[3].as<int64_t>();
  r.body         = row[4].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  if (r.run_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "run_id is required");
  }
  if (r.timestamp_ms == 0) {
    r.timestamp_ms = NowMs();
  }

  try {
    auto res   = TX(t).Work().exec_prepared1("insert_event", r.run_id, r.event_type, r.timestamp_ms, r.body);
    r.position = res[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EventRecord> PgRepository::GetEventByPosition(Transaction& t, uint64_t position) {
  auto res = TX(t).Work().exec_prepared("get_event", position);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t cursor,
                                                         std::optional<uint64_t> max_events) {
  // LIMIT NULL is unbounded
  std::optional<int64_t> limit;
  if (max_events) limit = static_cast<int64_t>(*max_events);

  auto res = TX(t).Work().exec_prepared("read_run_events", run_id, cursor, limit);

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

std::optional<uint64_t> PgRepository::GetMaxPosition(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_prepared("max_run_position", run_id);
  if (res.empty() || res[0][0].is_null()) return std::nullopt;
  return res[0][0].as<uint64_t>();
}

Result PgRepository::DeleteRun(Transaction& t, const std::string& run_id) {
  try {
    TX(t).Work().exec_prepared0("delete_run", run_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::Wipe(Transaction& t) {
  try {
    TX(t).Work().exec0("DELETE FROM event_logs;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::QueueNotification(Transaction& t, const std::string& channel, const std::string& payload) {
  try {
    TX(t).Work().exec_prepared("notify", channel, payload);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace eventlog::db::postgres
