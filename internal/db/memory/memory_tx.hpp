#pragma once

#include <cstdint>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace relaynorm::db::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> serial_;
  MemoryRepository::State      working_;
  std::uint64_t                snapshot_version_ = 0;
  bool                         committed_        = false;
  bool                         rolled_back_      = false;
};

} // namespace relaynorm::db::memory
