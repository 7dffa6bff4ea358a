#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/notify/notification.hpp"
#include "internal/storage/event_log_storage.hpp"
#include "internal/watch/watch_loop.hpp"

namespace eventlog::factory {

/*
  Runtime

  Owns the long-lived objects of one process. Destroy storage first: it
  joins the watcher thread, which still reads through repository and source.
*/
struct Runtime {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<notify::NotificationSource> source;
  std::unique_ptr<storage::EventLogStorage>   storage;
};

watch::WatchLoopOptions WatchOptionsFromConfig(const eventlog::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the ONLY place that knows concrete store and
  notification source types.

    postgres -> PgRepository + PgNotificationSource (LISTEN/NOTIFY)
    sqlite   -> SqliteRepository + LocalNotificationHub
    (none)   -> MemoryRepository + LocalNotificationHub
*/
Runtime Build(const eventlog::runtime::config::RuntimeConfig& config);

} // namespace eventlog::factory
