#pragma once

#include <string>
#include <vector>

namespace flowsched::db::sql {

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
  Every statement is idempotent (IF NOT EXISTS), so bootstrapping an
  existing database is a no-op.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace flowsched::db::sql
