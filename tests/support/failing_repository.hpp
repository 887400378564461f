#pragma once

#include <atomic>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace offsync::testing {

/*
  Memory repository whose writes can be switched to fail, as a full disk
  or a locked database would.
*/
class FailingRepository final : public db::Repository {
 public:
  FailingRepository() : inner_(std::make_shared<db::memory::MemoryRepository>()) {
  }

  void SetFailing(bool failing) {
    failing_ = failing;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    if (failing_) throw util::StorageUnavailable("disk full");
    return inner_->Begin();
  }

  std::unique_ptr<db::Transaction> BeginRead() override {
    if (failing_) throw util::StorageUnavailable("disk full");
    return inner_->BeginRead();
  }

  int SchemaVersion() override {
    return inner_->SchemaVersion();
  }

  db::Result AppendOperation(db::Transaction& tx, const db::model::OperationRecord& record) override {
    return inner_->AppendOperation(tx, record);
  }

  std::optional<db::model::OperationRecord> GetOperation(db::Transaction& tx, const std::string& id) override {
    return inner_->GetOperation(tx, id);
  }

  std::vector<db::model::OperationRecord> ListOperations(db::Transaction& tx) override {
    return inner_->ListOperations(tx);
  }

  db::Result UpdateOperation(db::Transaction& tx, const db::model::OperationRecord& record) override {
    return inner_->UpdateOperation(tx, record);
  }

  db::Result RemoveOperation(db::Transaction& tx, const std::string& id) override {
    return inner_->RemoveOperation(tx, id);
  }

  db::Result ClearOperations(db::Transaction& tx) override {
    return inner_->ClearOperations(tx);
  }

  uint64_t MaxSequence(db::Transaction& tx) override {
    return inner_->MaxSequence(tx);
  }

  std::optional<db::model::CacheRecord> GetCache(db::Transaction& tx, const std::string& collection, const std::string& key) override {
    return inner_->GetCache(tx, collection, key);
  }

  std::vector<db::model::CacheRecord> ListCache(db::Transaction& tx, const std::optional<std::string>& collection) override {
    return inner_->ListCache(tx, collection);
  }

  db::Result PutCache(db::Transaction& tx, const db::model::CacheRecord& record) override {
    return inner_->PutCache(tx, record);
  }

  db::Result DeleteCache(db::Transaction& tx, const std::string& collection, const std::string& key) override {
    return inner_->DeleteCache(tx, collection, key);
  }

  db::Result DeleteCacheCollection(db::Transaction& tx, const std::string& collection) override {
    return inner_->DeleteCacheCollection(tx, collection);
  }

  db::Result PruneCacheOlderThan(db::Transaction& tx, uint64_t cutoff_ms) override {
    return inner_->PruneCacheOlderThan(tx, cutoff_ms);
  }

  db::Result ClearAll(db::Transaction& tx) override {
    return inner_->ClearAll(tx);
  }

 private:
  std::shared_ptr<db::memory::MemoryRepository> inner_;
  std::atomic<bool>                             failing_{false};
};

} // namespace offsync::testing
