#include "sqlite_repository.hpp"

#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace offsync::db::sqlite {

using offsync::db::ErrorCode;
using offsync::db::Result;

namespace {

/*
  Owns one prepared statement for the duration of a call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw util::StorageUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  // Step expecting a row or end of results; anything else is a storage failure.
  bool NextRow() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StorageUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::string ConflictToJson(const offsync::v1::ConflictInfo& conflict) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(conflict, &json);
  if (!status.ok()) {
    throw util::StorageUnavailable("conflict serialize failed: " + std::string(status.message()));
  }
  return json;
}

offsync::v1::ConflictInfo ConflictFromJson(const std::string& json) {
  offsync::v1::ConflictInfo conflict;
  auto                      status = google::protobuf::util::JsonStringToMessage(json, &conflict);
  if (!status.ok()) {
    throw util::StorageUnavailable("stored conflict is corrupt: " + std::string(status.message()));
  }
  return conflict;
}

offsync::model::Document DocumentColumn(sqlite3_stmt* st, int col) {
  try {
    return offsync::model::FromJson(ColText(st, col));
  } catch (const std::runtime_error& e) {
    throw util::StorageUnavailable(std::string("stored document is corrupt: ") + e.what());
  }
}

// Binds every column except id, starting at `first`. Returns the next free index.
int BindOperationBody(sqlite3_stmt* st, int first, const model::OperationRecord& r) {
  int i = first;
  BindI32(st, i++, static_cast<int>(r.kind));
  BindText(st, i++, r.collection);
  BindOptText(st, i++, r.target_id);
  BindText(st, i++, offsync::model::ToJson(r.payload));
  BindOptU64(st, i++, r.base_version);
  BindU64(st, i++, r.enqueued_at_ms);
  BindU64(st, i++, r.sequence);
  BindU64(st, i++, r.attempts);
  BindText(st, i++, r.last_error);
  BindI32(st, i++, static_cast<int>(r.error_kind));
  BindI32(st, i++, r.priority);
  BindI32(st, i++, static_cast<int>(r.status));
  BindOptText(st, i++, r.base_snapshot ? std::optional<std::string>(offsync::model::ToJson(*r.base_snapshot)) : std::nullopt);
  BindU64(st, i++, r.next_attempt_at_ms);
  BindOptText(st, i++, r.conflict ? std::optional<std::string>(ConflictToJson(*r.conflict)) : std::nullopt);
  return i;
}

model::OperationRecord OperationFromRow(sqlite3_stmt* st) {
  model::OperationRecord r;
  r.id         = ColText(st, 0);
  r.kind       = static_cast<model::OperationKind>(ColI32(st, 1));
  r.collection = ColText(st, 2);
  if (!ColIsNull(st, 3)) r.target_id = ColText(st, 3);
  r.payload = DocumentColumn(st, 4);
  if (!ColIsNull(st, 5)) r.base_version = ColU64(st, 5);
  r.enqueued_at_ms = ColU64(st, 6);
  r.sequence       = ColU64(st, 7);
  r.attempts       = static_cast<uint32_t>(ColU64(st, 8));
  r.last_error     = ColText(st, 9);
  r.error_kind     = static_cast<model::ErrorKind>(ColI32(st, 10));
  r.priority       = ColI32(st, 11);
  r.status         = static_cast<offsync::model::OperationStatus>(ColI32(st, 12));
  if (!ColIsNull(st, 13)) r.base_snapshot = DocumentColumn(st, 13);
  r.next_attempt_at_ms = ColU64(st, 14);
  if (!ColIsNull(st, 15)) r.conflict = ConflictFromJson(ColText(st, 15));
  return r;
}

model::CacheRecord CacheFromRow(sqlite3_stmt* st) {
  model::CacheRecord r;
  r.collection    = ColText(st, 0);
  r.key           = ColText(st, 1);
  r.data          = DocumentColumn(st, 2);
  r.version       = ColU64(st, 3);
  r.fetched_at_ms = ColU64(st, 4);
  r.provisional   = ColI32(st, 5) != 0;
  r.deleted       = ColI32(st, 6) != 0;
  return r;
}

// A second connection to these would open a different, empty database.
bool IsInMemory(const std::string& path) {
  return path.empty() || path == ":memory:" || path.rfind("file::memory:", 0) == 0 || path.find("mode=memory") != std::string::npos;
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  }

  int CurrentVersion() override {
    db_->Exec(sql::CREATE_MIGRATIONS_TABLE);
    Statement st(db_->Handle(), sql::SELECT_SCHEMA_VERSION);
    return st.NextRow() ? ColI32(st.get(), 0) : 0;
  }

  void ApplyMigration(const sql::Migration& migration) override {
    SqliteTransaction tx(db_, SqliteTransaction::Mode::kWrite);
    for (const auto& statement : migration.statements) {
      db_->Exec(statement);
    }

    Statement st(db_->Handle(), sql::INSERT_SCHEMA_VERSION);
    BindI32(st.get(), 1, migration.version);
    BindU64(st.get(), 2, util::ToUnixMillis(util::Now()));
    if (st.Step() != SQLITE_DONE) {
      throw util::StorageUnavailable(std::string("record schema version: ") + sqlite3_errmsg(db_->Handle()));
    }
    tx.Commit();
  }

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    SqliteMigrationExecutor executor(db_);
    sql::RunMigrations(executor, sql::SchemaMigrations());

    if (!IsInMemory(db_->Path())) {
        reader_ = std::make_shared<SqliteDB>(db_->Path(), false, SqliteDB::Role::kReader);
    }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    if (!reader_) {
        return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
    }
    return std::make_unique<SqliteTransaction>(reader_, SqliteTransaction::Mode::kRead);
}

int SqliteRepository::SchemaVersion() {
    SqliteMigrationExecutor executor(db_);
    return executor.CurrentVersion();
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Operation log
// ------------------------------------------------------------------

Result SqliteRepository::AppendOperation(Transaction& t, const model::OperationRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_OPERATION);
    BindText(st.get(), 1, r.id);
    BindOperationBody(st.get(), 2, r);

    int rc = st.Step();
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "operation " + r.id + " already exists");
    return Translate(db, rc);
}

std::optional<model::OperationRecord>
SqliteRepository::GetOperation(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_OPERATION);
    BindText(st.get(), 1, id);

    if (!st.NextRow())
        return std::nullopt;
    return OperationFromRow(st.get());
}

std::vector<model::OperationRecord> SqliteRepository::ListOperations(Transaction& t) {
    Statement st(TX(t).Handle(), sql::LIST_OPERATIONS);

    std::vector<model::OperationRecord> out;
    while (st.NextRow())
        out.push_back(OperationFromRow(st.get()));
    return out;
}

Result SqliteRepository::UpdateOperation(Transaction& t, const model::OperationRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_OPERATION);
    int next = BindOperationBody(st.get(), 1, r);
    BindText(st.get(), next, r.id);

    int rc = st.Step();
    if (rc != SQLITE_DONE)
        return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "operation " + r.id + " not found");
    return Result::Ok();
}

Result SqliteRepository::RemoveOperation(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_OPERATION);
    BindText(st.get(), 1, id);

    int rc = st.Step();
    if (rc != SQLITE_DONE)
        return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "operation " + id + " not found");
    return Result::Ok();
}

Result SqliteRepository::ClearOperations(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::CLEAR_OPERATIONS);
    return Translate(db, st.Step());
}

uint64_t SqliteRepository::MaxSequence(Transaction& t) {
    Statement st(TX(t).Handle(), sql::MAX_SEQUENCE);
    return st.NextRow() ? ColU64(st.get(), 0) : 0;
}

// ------------------------------------------------------------------
// Cache
// ------------------------------------------------------------------

std::optional<model::CacheRecord>
SqliteRepository::GetCache(Transaction& t, const std::string& collection, const std::string& key) {
    Statement st(TX(t).Handle(), sql::SELECT_CACHE);
    BindText(st.get(), 1, collection);
    BindText(st.get(), 2, key);

    if (!st.NextRow())
        return std::nullopt;
    return CacheFromRow(st.get());
}

std::vector<model::CacheRecord>
SqliteRepository::ListCache(Transaction& t, const std::optional<std::string>& collection) {
    Statement st(TX(t).Handle(), collection ? sql::LIST_CACHE_COLLECTION : sql::LIST_CACHE);
    if (collection)
        BindText(st.get(), 1, *collection);

    std::vector<model::CacheRecord> out;
    while (st.NextRow())
        out.push_back(CacheFromRow(st.get()));
    return out;
}

Result SqliteRepository::PutCache(Transaction& t, const model::CacheRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_CACHE);
    BindText(st.get(), 1, r.collection);
    BindText(st.get(), 2, r.key);
    BindText(st.get(), 3, offsync::model::ToJson(r.data));
    BindU64(st.get(), 4, r.version);
    BindU64(st.get(), 5, r.fetched_at_ms);
    BindI32(st.get(), 6, r.provisional ? 1 : 0);
    BindI32(st.get(), 7, r.deleted ? 1 : 0);

    return Translate(db, st.Step());
}

Result SqliteRepository::DeleteCache(Transaction& t, const std::string& collection, const std::string& key) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_CACHE);
    BindText(st.get(), 1, collection);
    BindText(st.get(), 2, key);

    return Translate(db, st.Step());
}

Result SqliteRepository::DeleteCacheCollection(Transaction& t, const std::string& collection) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_CACHE_COLLECTION);
    BindText(st.get(), 1, collection);

    return Translate(db, st.Step());
}

Result SqliteRepository::PruneCacheOlderThan(Transaction& t, uint64_t cutoff_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::PRUNE_CACHE);
    BindU64(st.get(), 1, cutoff_ms);

    return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Both regions
// ------------------------------------------------------------------

Result SqliteRepository::ClearAll(Transaction& t) {
    auto* db = TX(t).Handle();

    {
        Statement ops(db, sql::CLEAR_OPERATIONS);
        auto r = Translate(db, ops.Step());
        if (!r) return r;
    }

    Statement cache(db, sql::CLEAR_CACHE);
    return Translate(db, cache.Step());
}

} // namespace offsync::db::sqlite
