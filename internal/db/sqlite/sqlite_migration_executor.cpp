#include "sqlite_migration_executor.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace heartbeat::db::sqlite {

SqliteMigrationExecutor::SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
}

void SqliteMigrationExecutor::ExecuteSQL(const std::string& sql) {
  db_->Exec("BEGIN IMMEDIATE;");
  try {
    db_->Exec(sql);
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    db_->Exec("ROLLBACK;");
    throw;
  }
}

int SqliteMigrationExecutor::CurrentVersion() {
  Stmt stmt = db_->Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("schema_migrations read failed: ") + sqlite3_errmsg(db_->Handle()));
  }
  return sqlite3_column_int(stmt.get(), 0);
}

void SqliteMigrationExecutor::RecordVersion(int version) {
  Stmt stmt = db_->Prepare("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(?, ?);");
  sqlite3_bind_int(stmt.get(), 1, version);
  sqlite3_bind_int64(stmt.get(), 2, util::ToUnixMillis(util::Now()));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error(std::string("schema_migrations write failed: ") + sqlite3_errmsg(db_->Handle()));
  }
}

} // namespace heartbeat::db::sqlite
