#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/watch/watcher.hpp"

namespace eventlog::storage {

/*
  EventLogStorage

  Producer and consumer side of one event log.

  Design notes:
  -------------
  - StoreEvent() appends the record and queues "{run_id}_{position}" on the
    watcher's channel in the same transaction, so a notification is never
    published for a record that did not commit.
  - Writes are serialized here; reads take their own short transaction.
  - Watch()/EndWatch() forward to the owned Watcher, whose thread starts on
    the first Watch().
  - Dispose() closes the watcher once. Reads and writes keep working after
    it; Watch() does not.
*/
class EventLogStorage {
 public:
  EventLogStorage(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::NotificationSource> source,
                  watch::WatchLoopOptions options);
  ~EventLogStorage();

  EventLogStorage(const EventLogStorage&)            = delete;
  EventLogStorage& operator=(const EventLogStorage&) = delete;

  // Returns the assigned position. body must be a JSON document; an empty
  // body is stored as "{}". A zero timestamp is replaced by the current time.
  uint64_t StoreEvent(db::model::EventRecord record);

  // Events of run_id with position >= cursor, ascending.
  std::vector<db::model::EventRecord> GetEvents(const std::string& run_id, uint64_t cursor = 0,
                                                std::optional<uint64_t> limit = std::nullopt);

  std::optional<uint64_t> GetLatestPosition(const std::string& run_id);

  void DeleteRun(const std::string& run_id);
  void Wipe();

  void Watch(const std::string& run_id, uint64_t cursor, watch::CallbackPtr callback);
  void EndWatch(const std::string& run_id, const watch::CallbackPtr& callback);

  void Dispose();

  watch::Watcher& EventWatcher() {
    return *watcher_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     channel_;
  std::unique_ptr<watch::Watcher> watcher_;

  std::mutex write_mutex_;
  std::mutex dispose_mutex_;
  bool       disposed_ = false;
};

} // namespace eventlog::storage
