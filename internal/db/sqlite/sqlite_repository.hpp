#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace offsync::db::sqlite {

/*
  SQLite-backed durable store.

  Construction migrates the schema to the latest version and refuses a
  store written by a newer binary. Read-only transactions go through a
  second connection so they never queue behind a writer. An in-memory
  database has no second connection and reads share the writer's.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;
  std::shared_ptr<SqliteDB> reader_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
