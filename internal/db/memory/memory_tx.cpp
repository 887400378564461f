#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace offsync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, Mode mode) : repo_(repo), mode_(mode) {
  if (mode_ == Mode::kWrite) writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);

  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ == Mode::kRead) throw std::logic_error("write through a read transaction");
  return working_;
}

void MemoryTransaction::Commit() {
  if (mode_ == Mode::kRead) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::StorageUnavailable("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
  writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace offsync::db::memory
