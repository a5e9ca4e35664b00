#pragma once

#include <string>
#include <vector>

namespace heartbeat::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the applied-version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied version, 0 on a fresh database.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

struct Migration {
  int         version = 0;
  std::string sql;
};

/*
  Runs migrations in order, skipping versions already applied.
  Returns the number of migrations applied.
*/

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

} // namespace heartbeat::db::sql
