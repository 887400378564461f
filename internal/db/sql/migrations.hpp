#pragma once

#include <string>
#include <vector>

namespace offsync::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; migrations are applied in version
  order, each inside its own transaction together with its version row.
*/

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual int  CurrentVersion()                                = 0;
  virtual void ApplyMigration(const Migration& migration)      = 0;
};

// Schema history of the operation log and cache tables.
const std::vector<Migration>& SchemaMigrations();

int LatestSchemaVersion();

/*
  Runs every migration newer than the executor's current version.

  Throws util::StorageUnavailable when the store was written by a newer
  schema than this binary knows.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace offsync::db::sql
