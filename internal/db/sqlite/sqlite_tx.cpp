#include "sqlite_tx.hpp"

namespace offsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode)
    : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec(mode == Mode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // Destructors must not throw; a failed ROLLBACK leaves sqlite to
    // discard the journal on next open.
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace offsync::db::sqlite
