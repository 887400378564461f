#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offsync::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {"CREATE TABLE IF NOT EXISTS operation_log (id TEXT PRIMARY KEY, kind INTEGER NOT NULL, collection TEXT NOT NULL, target_id TEXT, "
        "payload TEXT NOT NULL, base_version INTEGER, enqueued_at_ms INTEGER NOT NULL, sequence INTEGER NOT NULL, attempts INTEGER NOT NULL, "
        "last_error TEXT NOT NULL DEFAULT '', error_kind INTEGER NOT NULL DEFAULT 0, priority INTEGER NOT NULL, status INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS cache_entries (collection TEXT NOT NULL, key TEXT NOT NULL, data TEXT NOT NULL, version INTEGER NOT NULL, "
        "fetched_at_ms INTEGER NOT NULL, provisional INTEGER NOT NULL, deleted INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (collection, key));",
        "CREATE INDEX IF NOT EXISTS cache_entries_fetched_at ON cache_entries(fetched_at_ms);"}},
      {2,
       {"ALTER TABLE operation_log ADD COLUMN base_snapshot TEXT;",
        "ALTER TABLE operation_log ADD COLUMN next_attempt_at_ms INTEGER NOT NULL DEFAULT 0;",
        "ALTER TABLE operation_log ADD COLUMN conflict TEXT;",
        "CREATE INDEX IF NOT EXISTS operation_log_delivery_order ON operation_log(priority, enqueued_at_ms, sequence);"}},
  };
  return kMigrations;
}

int LatestSchemaVersion() {
  return SchemaMigrations().back().version;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int current = executor.CurrentVersion();
  const int latest  = ordered.empty() ? 0 : ordered.back().version;

  if (current > latest) {
    throw util::StorageUnavailable("store schema version " + std::to_string(current) + " is newer than supported version " +
                                   std::to_string(latest));
  }

  for (const auto& migration : ordered) {
    if (migration.version <= current) {
      continue;
    }
    executor.ApplyMigration(migration);
    OFFSYNC_LOG_INFO("Applied schema migration", {observability::IntField("version", migration.version)});
  }
}

} // namespace offsync::db::sql
