#pragma once

#include <pqxx/pqxx>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace heartbeat::db::postgres {

/*
  Applies migrations on a dedicated connection.

  PgPool prepares its statements against the final schema, so the
  schema has to exist before the pool hands out its first connection.
*/
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(const std::string& conninfo);

  void ExecuteSQL(const std::string& sql) override;
  int  CurrentVersion() override;
  void RecordVersion(int version) override;

 private:
  pqxx::connection conn_;
};

} // namespace heartbeat::db::postgres
