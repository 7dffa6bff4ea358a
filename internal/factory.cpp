#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/local_hub.hpp"
#include "internal/observability/logging.hpp"
#if EVENTLOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if EVENTLOG_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/notify/pg_notification_source.hpp"
#endif

namespace eventlog::factory {

using eventlog::observability::StringField;

watch::WatchLoopOptions WatchOptionsFromConfig(const eventlog::runtime::config::RuntimeConfig& config) {
  const auto& watcher = config.watcher();

  watch::WatchLoopOptions options;
  options.channel                   = watcher.channel();
  options.reconnect.enabled         = watcher.reconnect().enabled();
  options.reconnect.max_attempts    = watcher.reconnect().max_attempts();
  options.reconnect.initial_backoff = std::chrono::milliseconds(watcher.reconnect().initial_backoff_ms());
  options.reconnect.max_backoff     = std::chrono::milliseconds(watcher.reconnect().max_backoff_ms());
  return options;
}

Runtime Build(const eventlog::runtime::config::RuntimeConfig& config) {
  Runtime     runtime;
  const auto& database      = config.database();
  const auto  poll_interval = std::chrono::milliseconds(config.watcher().poll_interval_ms());

  if (database.has_postgres()) {
#if EVENTLOG_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections());
    pool->Bootstrap();
    runtime.repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    runtime.source     = std::make_shared<notify::PgNotificationSource>(postgres.connection_uri(), poll_interval);
    EVENTLOG_LOG_INFO("event store selected", {StringField("backend", "postgres")});
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  } else if (database.has_sqlite()) {
#if EVENTLOG_DB_SQLITE
    auto hub       = std::make_shared<notify::LocalNotificationHub>(poll_interval);
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->Bootstrap();
    runtime.repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), hub);
    runtime.source     = hub;
    EVENTLOG_LOG_INFO("event store selected", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  } else {
    auto hub           = std::make_shared<notify::LocalNotificationHub>(poll_interval);
    runtime.repository = std::make_shared<db::memory::MemoryRepository>(hub);
    runtime.source     = hub;
    EVENTLOG_LOG_INFO("event store selected", {StringField("backend", "memory")});
  }

  runtime.storage = std::make_unique<storage::EventLogStorage>(runtime.repository, runtime.source, WatchOptionsFromConfig(config));
  return runtime;
}

} // namespace eventlog::factory
