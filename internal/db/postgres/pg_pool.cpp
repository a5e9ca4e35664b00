#include "pg_pool.hpp"

#include "internal/util/errors.hpp"

namespace heartbeat::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const bool ready = cv_.wait_for(lock, acquire_timeout_, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });
  if (!ready) {
    throw util::StorageError("postgres pool exhausted: " + std::to_string(max_connections_) + " connections in use", true);
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(std::move(conn));
  }

  // reserve the slot, then connect without holding the lock
  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(Connect());
  } catch (const std::exception&) {
    {
      std::lock_guard relock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  PrepareStatements(*conn);
  return conn;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_client",
               "INSERT INTO clients(tenant,id,last_seen_ms,source_ip,user_agent,meta_json,verified) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7) "
               "ON CONFLICT(tenant,id) DO UPDATE SET last_seen_ms=EXCLUDED.last_seen_ms, "
               "source_ip=EXCLUDED.source_ip, user_agent=EXCLUDED.user_agent, "
               "meta_json=EXCLUDED.meta_json, verified=EXCLUDED.verified");

  conn.prepare("index_client",
               "INSERT INTO client_index(tenant,id) VALUES($1,$2) ON CONFLICT(tenant,id) DO NOTHING");

  conn.prepare("get_client",
               "SELECT tenant,id,last_seen_ms,source_ip,user_agent,meta_json::text,verified "
               "FROM clients WHERE tenant=$1 AND id=$2");

  conn.prepare("list_client_ids", "SELECT id FROM client_index WHERE tenant=$1 ORDER BY seq ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [weak_self](pqxx::connection* returned) {
    if (auto self = weak_self.lock()) {
      self->Release(returned);
      return;
    }
    delete returned;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace heartbeat::db::postgres
