#pragma once

#include <string>
#include <vector>

namespace relaynorm::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS), so running twice is harmless.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema per backend, in dependency order.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace relaynorm::db::sql
