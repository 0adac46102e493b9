#pragma once

#include <string>
#include <vector>

namespace wfrun::db::sql {

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
  Runs migrations in order.
  Every statement is idempotent (IF NOT EXISTS / OR REPLACE), so the
  full list is replayed on each startup.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace wfrun::db::sql
