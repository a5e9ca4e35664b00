#pragma once

#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace heartbeat::db::sqlite {

/*
  Applies migrations through SqliteDB::Exec and tracks them in
  schema_migrations.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db);

  void ExecuteSQL(const std::string& sql) override;
  int  CurrentVersion() override;
  void RecordVersion(int version) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace heartbeat::db::sqlite
