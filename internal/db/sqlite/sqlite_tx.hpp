#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace offsync::db::sqlite {

/*
  SQLite transaction wrapper.

  Writes use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Reads use BEGIN DEFERRED on the reader connection and only take a WAL
  snapshot.

  A connection is shared, so the transaction also holds that
  connection's transaction mutex until it finishes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kWrite, kRead };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
