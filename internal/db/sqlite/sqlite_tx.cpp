#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace heartbeat::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->LockTransaction()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (IsFinished()) return;
  try {
    DoRollback();
  } catch (const std::exception& e) {
    HEARTBEAT_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::DoCommit() {
  db_->Exec("COMMIT;");
}

void SqliteTransaction::DoRollback() {
  db_->Exec("ROLLBACK;");
}

} // namespace heartbeat::db::sqlite
