#pragma once

#include <stdexcept>

namespace heartbeat::db {

/*
  Unit of work over one Repository.

  Writes are invisible to other transactions until Commit(). A
  transaction destroyed without Commit() is rolled back by the backend.
  Commit() and Rollback() may each be called once; a second call on a
  finished transaction throws std::logic_error.

    memory    per-tenant snapshot, conflict detected at commit
    sqlite    BEGIN IMMEDIATE on the shared connection, one at a time
    postgres  pqxx::work on a pooled connection
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  void Commit() {
    RequireOpen();
    DoCommit();
    finished_  = true;
    committed_ = true;
  }

  void Rollback() {
    RequireOpen();
    finished_ = true;
    DoRollback();
  }

  bool IsCommitted() const {
    return committed_;
  }

 protected:
  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

  // Backends call this from their destructor to discard an abandoned transaction.
  bool IsFinished() const {
    return finished_;
  }

 private:
  void RequireOpen() const {
    if (finished_) {
      throw std::logic_error("transaction already finished");
    }
  }

  bool finished_  = false;
  bool committed_ = false;
};

} // namespace heartbeat::db
