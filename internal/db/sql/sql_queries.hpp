#pragma once

namespace offsync::db::sql {

/*
  Canonical SQL for the sqlite backend.

  Column order of SELECT_OPERATION_COLUMNS is relied on by the row decoder.
*/

#define OFFSYNC_OPERATION_COLUMNS                                                                                     \
  "id,kind,collection,target_id,payload,base_version,enqueued_at_ms,sequence,attempts,last_error,error_kind,priority," \
  "status,base_snapshot,next_attempt_at_ms,conflict"

static constexpr const char* INSERT_OPERATION =
    "INSERT INTO operation_log(" OFFSYNC_OPERATION_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_OPERATION =
    "SELECT " OFFSYNC_OPERATION_COLUMNS " FROM operation_log WHERE id=?;";

static constexpr const char* LIST_OPERATIONS =
    "SELECT " OFFSYNC_OPERATION_COLUMNS " FROM operation_log"
    " ORDER BY priority ASC, enqueued_at_ms ASC, sequence ASC;";

static constexpr const char* UPDATE_OPERATION =
    "UPDATE operation_log SET kind=?,collection=?,target_id=?,payload=?,base_version=?,enqueued_at_ms=?,sequence=?,"
    "attempts=?,last_error=?,error_kind=?,priority=?,status=?,base_snapshot=?,next_attempt_at_ms=?,conflict=?"
    " WHERE id=?;";

static constexpr const char* DELETE_OPERATION = "DELETE FROM operation_log WHERE id=?;";

static constexpr const char* CLEAR_OPERATIONS = "DELETE FROM operation_log;";

static constexpr const char* MAX_SEQUENCE = "SELECT COALESCE(MAX(sequence),0) FROM operation_log;";

// cache

#define OFFSYNC_CACHE_COLUMNS "collection,key,data,version,fetched_at_ms,provisional,deleted"

static constexpr const char* UPSERT_CACHE =
    "INSERT INTO cache_entries(" OFFSYNC_CACHE_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(collection,key) DO UPDATE SET"
    " data=excluded.data,"
    " version=excluded.version,"
    " fetched_at_ms=excluded.fetched_at_ms,"
    " provisional=excluded.provisional,"
    " deleted=excluded.deleted;";

static constexpr const char* SELECT_CACHE =
    "SELECT " OFFSYNC_CACHE_COLUMNS " FROM cache_entries WHERE collection=? AND key=?;";

static constexpr const char* LIST_CACHE = "SELECT " OFFSYNC_CACHE_COLUMNS " FROM cache_entries ORDER BY collection, key;";

static constexpr const char* LIST_CACHE_COLLECTION =
    "SELECT " OFFSYNC_CACHE_COLUMNS " FROM cache_entries WHERE collection=? ORDER BY key;";

static constexpr const char* DELETE_CACHE = "DELETE FROM cache_entries WHERE collection=? AND key=?;";

static constexpr const char* DELETE_CACHE_COLLECTION = "DELETE FROM cache_entries WHERE collection=?;";

static constexpr const char* PRUNE_CACHE = "DELETE FROM cache_entries WHERE provisional=0 AND fetched_at_ms<?;";

static constexpr const char* CLEAR_CACHE = "DELETE FROM cache_entries;";

// schema versioning

static constexpr const char* CREATE_MIGRATIONS_TABLE =
    "CREATE TABLE IF NOT EXISTS offsync_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);";

static constexpr const char* SELECT_SCHEMA_VERSION = "SELECT COALESCE(MAX(version),0) FROM offsync_schema_migrations;";

static constexpr const char* INSERT_SCHEMA_VERSION = "INSERT INTO offsync_schema_migrations(version,applied_at_ms) VALUES(?,?);";

} // namespace offsync::db::sql
