#pragma once

#include <pqxx/pqxx>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace heartbeat::db::postgres {

/*
  Bounded pool of pqxx connections shared by every tenant.

  A pqxx::connection is not thread-safe, so each transaction holds one
  connection exclusively. Statements are prepared when a connection is
  opened, which requires the schema to exist: run migrations first.

  Acquire() blocks while max_connections are checked out and gives up
  with a retryable StorageError after acquire_timeout. Connections that
  come back closed are discarded and their slot is freed.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  static constexpr std::chrono::milliseconds kDefaultAcquireTimeout{5000};

  explicit PgPool(std::string conninfo, std::size_t max_connections = 16,
                  std::chrono::milliseconds acquire_timeout = kDefaultAcquireTimeout);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::unique_ptr<pqxx::connection> Connect();
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(std::unique_ptr<pqxx::connection> conn);
  void                              Release(pqxx::connection* conn);

  std::string               conninfo_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace heartbeat::db::postgres
