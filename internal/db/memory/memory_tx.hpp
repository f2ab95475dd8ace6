#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace escrow::db::memory {

/*
  Transaction = shared snapshot + private copy on first write

  A transaction that never asked for Mutable() commits as a no-op, so
  read-only snapshots never conflict with a concurrent writer.
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

  MemoryRepository::State& Mutable() {
    if (!working_) {
      working_ = std::make_shared<MemoryRepository::State>(*snapshot_);
    }
    return *working_;
  }
  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::shared_ptr<MemoryRepository::State>       working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace escrow::db::memory
