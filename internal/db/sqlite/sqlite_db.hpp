#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace offsync::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Failures surface as util::StorageUnavailable.

  A reader connection attaches to an existing database with query_only set;
  with WAL its transactions run beside the writer's.
*/
class SqliteDB {
 public:
  enum class Role { kWriter, kReader };

  explicit SqliteDB(std::string path, bool relaxed_sync = false, Role role = Role::kWriter);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  Role role() const {
    return role_;
  }

  // One transaction at a time on the shared connection.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  // WAL + synchronous=FULL unless relaxed.
  void Configure(bool relaxed_sync);

  sqlite3*    db_ = nullptr;
  std::string path_;
  Role        role_;
  std::mutex  tx_mutex_;
};

} // namespace offsync::db::sqlite
