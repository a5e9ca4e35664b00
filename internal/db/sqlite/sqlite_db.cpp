#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace heartbeat::db::sqlite {

namespace {

bool IsInMemory(const std::string& path) {
  return path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("sqlite: cannot create " + parent.string() + ": " + ec.message());
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("sqlite: database path is empty");
  }
  if (!IsInMemory(path_)) {
    EnsureParentDirectory(path_);
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    ApplyPragmas(busy_timeout_ms);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = std::string("sqlite exec: ") + (err ? err : sqlite3_errstr(rc));
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

Stmt SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }
  return Stmt(stmt);
}

void SqliteDB::ApplyPragmas(int busy_timeout_ms) {
  // readers (list, status) proceed while a ping holds the write lock
  if (!IsInMemory(path_)) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");

  if (sqlite3_busy_timeout(db_, busy_timeout_ms > 0 ? busy_timeout_ms : kDefaultBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace heartbeat::db::sqlite
