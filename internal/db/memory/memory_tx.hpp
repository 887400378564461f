#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace offsync::db::memory {

/*
  Transaction = snapshot + write set

  Writers are serialized like sqlite's BEGIN IMMEDIATE: the writer lock is
  held from construction until Commit/Rollback. Readers only copy the
  committed state.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  enum class Mode { kWrite, kRead };

  MemoryTransaction(MemoryRepository& repo, Mode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  Mode                         mode_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace offsync::db::memory
