#include "record_fetcher.hpp"

#include "internal/observability/logging.hpp"

namespace eventlog::watch {

using eventlog::observability::IntField;
using eventlog::observability::StringField;

RepositoryRecordFetcher::RepositoryRecordFetcher(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<db::model::EventRecord> RepositoryRecordFetcher::Fetch(const std::string& stream_id, uint64_t position) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetEventByPosition(*tx, position);
  tx->Rollback();

  if (record && record->run_id != stream_id) {
    EVENTLOG_LOG_WARN("notification points at another run's record",
                      {StringField("stream_id", stream_id), IntField("position", static_cast<int64_t>(position)),
                       StringField("record_run_id", record->run_id)});
    return std::nullopt;
  }
  return record;
}

} // namespace eventlog::watch
