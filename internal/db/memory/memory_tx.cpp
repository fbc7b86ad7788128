#include "memory_tx.hpp"

#include <stdexcept>

namespace relaynorm::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), serial_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
  serial_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  working_     = {};
  rolled_back_ = true;
  serial_.unlock();
}

} // namespace relaynorm::db::memory
