#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace eventlog::db::memory {

/*
  Transaction = copy-on-write snapshot + queued notifications

  Until the first write, reads look up the committed state under the
  repository lock and nothing is copied. The first write takes the snapshot;
  Commit() fails if another transaction committed after that point.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();

  template <typename Fn>
  auto Read(Fn&& fn) const {
    if (working_) {
      return fn(*working_);
    }
    std::scoped_lock lock(repo_.mutex_);
    return fn(repo_.committed_);
  }

  bool HasSnapshot() const {
    return working_.has_value();
  }

  void Queue(std::string channel, std::string payload) {
    notifications_.emplace_back(std::move(channel), std::move(payload));
  }

 private:
  MemoryRepository&                                repo_;
  std::optional<MemoryRepository::State>           working_;
  uint64_t                                         snapshot_version_ = 0;
  std::vector<std::pair<std::string, std::string>> notifications_;
  bool                                             committed_   = false;
  bool                                             rolled_back_ = false;
};

} // namespace eventlog::db::memory
