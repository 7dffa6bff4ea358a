#include "memory_tx.hpp"

#include <stdexcept>

namespace eventlog::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    std::scoped_lock lock(repo_.mutex_);
    working_          = repo_.committed_;
    snapshot_version_ = repo_.committed_version_;
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (working_) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != snapshot_version_) {
      throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
    }
    repo_.committed_ = std::move(*working_);
    repo_.committed_version_++;
  }
  committed_ = true;

  // after the lock: listeners may read back immediately
  if (repo_.hub_) {
    for (const auto& [channel, payload] : notifications_) {
      repo_.hub_->Publish(channel, payload);
    }
  }
  notifications_.clear();
}

void MemoryTransaction::Rollback() {
  working_.reset();
  notifications_.clear();
  rolled_back_ = true;
}

} // namespace eventlog::db::memory
