#pragma once

#include <pqxx/pqxx>

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace heartbeat::db::postgres {

// Holds one pooled connection for its lifetime.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  // declared first: the work must be destroyed before its connection goes back to the pool
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

} // namespace heartbeat::db::postgres
