#include "event_log_storage.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <utility>

#include "internal/notify/wire.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eventlog::storage {

using eventlog::observability::IntField;
using eventlog::observability::StringField;

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw std::runtime_error(prefix + ": " + result.message);
  }
}

void ValidateBody(const std::string& body) {
  google::protobuf::Value parsed;
  auto                    status = google::protobuf::util::JsonStringToMessage(body, &parsed);
  if (!status.ok()) {
    throw util::InvalidArgument("store_event: body is not valid JSON: " + std::string(status.message()));
  }
}

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

EventLogStorage::EventLogStorage(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::NotificationSource> source,
                                 watch::WatchLoopOptions options)
    : repository_(std::move(repository)), channel_(options.channel) {
  if (!repository_) {
    throw util::InvalidArgument("event log storage: repository is required");
  }
  watcher_ = std::make_unique<watch::Watcher>(std::move(source), std::make_shared<watch::RepositoryRecordFetcher>(repository_),
                                              std::move(options));
}

EventLogStorage::~EventLogStorage() {
  try {
    Dispose();
  } catch (const std::exception& e) {
    EVENTLOG_LOG_ERROR("event log storage dispose failed", {StringField("error", e.what())});
  }
}

uint64_t EventLogStorage::StoreEvent(db::model::EventRecord record) {
  if (record.run_id.empty()) {
    throw util::InvalidArgument("store_event: run_id is required");
  }
  if (record.body.empty()) {
    record.body = "{}";
  }
  ValidateBody(record.body);
  if (record.timestamp_ms == 0) {
    record.timestamp_ms = NowMillis();
  }

  std::lock_guard lock(write_mutex_);

  auto tx = repository_->Begin();
  ThrowIfError(repository_->AppendEvent(*tx, record), "store_event");
  ThrowIfError(repository_->QueueNotification(*tx, channel_, notify::FormatPayload(record.run_id, record.position)), "store_event notify");
  tx->Commit();

  EVENTLOG_LOG_DEBUG("event stored", {StringField("run_id", record.run_id), IntField("position", static_cast<int64_t>(record.position)),
                                      StringField("event_type", record.event_type)});
  return record.position;
}

std::vector<db::model::EventRecord> EventLogStorage::GetEvents(const std::string& run_id, uint64_t cursor, std::optional<uint64_t> limit) {
  auto tx     = repository_->Begin();
  auto events = repository_->ReadEvents(*tx, run_id, cursor, limit);
  tx->Rollback();
  return events;
}

std::optional<uint64_t> EventLogStorage::GetLatestPosition(const std::string& run_id) {
  auto tx     = repository_->Begin();
  auto latest = repository_->GetMaxPosition(*tx, run_id);
  tx->Rollback();
  return latest;
}

void EventLogStorage::DeleteRun(const std::string& run_id) {
  std::lock_guard lock(write_mutex_);

  auto tx = repository_->Begin();
  ThrowIfError(repository_->DeleteRun(*tx, run_id), "delete_run");
  tx->Commit();
  EVENTLOG_LOG_INFO("run events deleted", {StringField("run_id", run_id)});
}

void EventLogStorage::Wipe() {
  std::lock_guard lock(write_mutex_);

  auto tx = repository_->Begin();
  ThrowIfError(repository_->Wipe(*tx), "wipe");
  tx->Commit();
  EVENTLOG_LOG_WARN("event log wiped");
}

void EventLogStorage::Watch(const std::string& run_id, uint64_t cursor, watch::CallbackPtr callback) {
  watcher_->Watch(run_id, cursor, std::move(callback));
}

void EventLogStorage::EndWatch(const std::string& run_id, const watch::CallbackPtr& callback) {
  watcher_->Unwatch(run_id, callback);
}

void EventLogStorage::Dispose() {
  std::lock_guard lock(dispose_mutex_);
  if (disposed_) {
    return;
  }
  watcher_->Close();
  disposed_ = true;
}

} // namespace eventlog::storage
