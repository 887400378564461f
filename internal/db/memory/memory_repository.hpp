#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace offsync::db::memory {

class MemoryTransaction;

/*
  Process-local store used by tests and the `memory` database backend.

  Same contract as the sqlite backend except durability across restarts.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;
  int SchemaVersion() override;

  Result AppendOperation(Transaction&, const model::OperationRecord&) override;
  std::optional<model::OperationRecord> GetOperation(Transaction&, const std::string& id) override;
  std::vector<model::OperationRecord> ListOperations(Transaction&) override;
  Result UpdateOperation(Transaction&, const model::OperationRecord&) override;
  Result RemoveOperation(Transaction&, const std::string& id) override;
  Result ClearOperations(Transaction&) override;
  uint64_t MaxSequence(Transaction&) override;

  std::optional<model::CacheRecord> GetCache(Transaction&, const std::string& collection, const std::string& key) override;
  std::vector<model::CacheRecord> ListCache(Transaction&, const std::optional<std::string>& collection) override;
  Result PutCache(Transaction&, const model::CacheRecord&) override;
  Result DeleteCache(Transaction&, const std::string& collection, const std::string& key) override;
  Result DeleteCacheCollection(Transaction&, const std::string& collection) override;
  Result PruneCacheOlderThan(Transaction&, uint64_t cutoff_ms) override;

  Result ClearAll(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::OperationRecord> operations;
    // ordered so ListCache comes back sorted like the sqlite backend
    std::map<std::pair<std::string, std::string>, model::CacheRecord> cache;
  };

  std::mutex writer_mutex_;
  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
