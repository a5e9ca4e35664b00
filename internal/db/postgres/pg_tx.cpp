#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace heartbeat::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (IsFinished()) return;
  try {
    DoRollback();
  } catch (const std::exception& e) {
    HEARTBEAT_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::DoCommit() {
  work_->commit();
}

void PgTransaction::DoRollback() {
  work_->abort();
}

} // namespace heartbeat::db::postgres
