#include "pg_migration_executor.hpp"

namespace heartbeat::db::postgres {

PgMigrationExecutor::PgMigrationExecutor(const std::string& conninfo) : conn_(conninfo) {
  pqxx::work tx(conn_);
  tx.exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW())");
  tx.commit();
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  pqxx::work tx(conn_);
  tx.exec(sql);
  tx.commit();
}

int PgMigrationExecutor::CurrentVersion() {
  pqxx::work tx(conn_);
  auto       res = tx.exec("SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
  tx.commit();
  return res[0][0].as<int>();
}

void PgMigrationExecutor::RecordVersion(int version) {
  pqxx::work tx(conn_);
  tx.exec_params("INSERT INTO schema_migrations(version) VALUES($1)", version);
  tx.commit();
}

} // namespace heartbeat::db::postgres
