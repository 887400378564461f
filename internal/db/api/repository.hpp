#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_record.hpp"
#include "internal/db/model/operation_record.hpp"

namespace offsync::db {

/*
  Repository abstraction over the durable store.

  Two logical regions:
    operation log   keyed by operation id
    cache           keyed by (collection, key)

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A record is never observable half-written
  - Once Commit() returns the change survives process termination
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only snapshot of committed state. Never waits for a writer;
  // writing through it is an error.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // Persisted schema version of the backing store.
  virtual int SchemaVersion() = 0;

  // ---------------------------------------------------------------------
  // Operation log
  // ---------------------------------------------------------------------

  virtual Result AppendOperation(Transaction&, const model::OperationRecord&) = 0;

  virtual std::optional<model::OperationRecord> GetOperation(Transaction&, const std::string& id) = 0;

  // Ordered by (priority, enqueued_at, sequence).
  virtual std::vector<model::OperationRecord> ListOperations(Transaction&) = 0;

  // Atomic whole-record replace; NotFound if the id is unknown.
  virtual Result UpdateOperation(Transaction&, const model::OperationRecord&) = 0;

  virtual Result RemoveOperation(Transaction&, const std::string& id) = 0;

  virtual Result ClearOperations(Transaction&) = 0;

  // Highest sequence ever appended, 0 on an empty log.
  virtual uint64_t MaxSequence(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Cache
  // ---------------------------------------------------------------------

  virtual std::optional<model::CacheRecord> GetCache(Transaction&, const std::string& collection, const std::string& key) = 0;

  virtual std::vector<model::CacheRecord> ListCache(Transaction&, const std::optional<std::string>& collection) = 0;

  virtual Result PutCache(Transaction&, const model::CacheRecord&) = 0;

  virtual Result DeleteCache(Transaction&, const std::string& collection, const std::string& key) = 0;

  virtual Result DeleteCacheCollection(Transaction&, const std::string& collection) = 0;

  // Removes non-provisional entries with fetched_at < cutoff_ms.
  virtual Result PruneCacheOlderThan(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Both regions
  // ---------------------------------------------------------------------

  virtual Result ClearAll(Transaction&) = 0;
};

} // namespace offsync::db
