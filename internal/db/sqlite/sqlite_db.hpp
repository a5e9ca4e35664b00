#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace heartbeat::db::sqlite {

struct StmtDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

/*
  One shared SQLite connection for every tenant.

  The file (and its parent directory) is created on open. ":memory:"
  is passed through unchanged.
*/
class SqliteDB {
 public:
  static constexpr int kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more ';'-separated statements; throws on the first failure.
  void Exec(const std::string& sql);

  Stmt Prepare(const std::string& sql);

  // One connection carries one transaction at a time; held for the
  // lifetime of a SqliteTransaction.
  std::unique_lock<std::mutex> LockTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void ApplyPragmas(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace heartbeat::db::sqlite
