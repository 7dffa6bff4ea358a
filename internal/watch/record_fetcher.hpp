#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/event_record.hpp"

namespace eventlog::watch {

/*
  Reads the full record a notification points at.

  std::nullopt means the position is not (or no longer) visible: a
  fetch/commit race, not an error. Store failures are thrown.
*/
class RecordFetcher {
 public:
  virtual ~RecordFetcher() = default;

  virtual std::optional<db::model::EventRecord> Fetch(const std::string& stream_id, uint64_t position) = 0;
};

// Fetches through a short read-only repository transaction.
class RepositoryRecordFetcher final : public RecordFetcher {
 public:
  explicit RepositoryRecordFetcher(std::shared_ptr<db::Repository> repository);

  std::optional<db::model::EventRecord> Fetch(const std::string& stream_id, uint64_t position) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace eventlog::watch
