#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace heartbeat::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so a transaction never
  fails halfway through with SQLITE_BUSY on upgrade.

  The connection's transaction lock is held until destruction: on one
  thread, finish (or destroy) a transaction before beginning the next.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
};

} // namespace heartbeat::db::sqlite
