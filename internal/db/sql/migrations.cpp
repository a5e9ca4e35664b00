#include "migrations.hpp"

#include <stdexcept>

namespace heartbeat::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int current = executor.CurrentVersion();
  int       applied = 0;
  int       last    = 0;

  for (const auto& m : ordered) {
    if (m.version <= last) {
      throw std::invalid_argument("migrations must have strictly increasing versions");
    }
    last = m.version;
    if (m.version <= current) continue;

    executor.ExecuteSQL(m.sql);
    executor.RecordVersion(m.version);
    ++applied;
  }
  return applied;
}

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "CREATE TABLE IF NOT EXISTS clients (tenant TEXT NOT NULL, id TEXT NOT NULL, last_seen_ms INTEGER NOT NULL, "
       "source_ip TEXT, user_agent TEXT, meta_json TEXT, verified INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (tenant, id));"
       "CREATE TABLE IF NOT EXISTS client_index (seq INTEGER PRIMARY KEY AUTOINCREMENT, tenant TEXT NOT NULL, id TEXT NOT NULL, "
       "UNIQUE(tenant, id));"
       "CREATE TABLE IF NOT EXISTS client_state (tenant TEXT NOT NULL, id TEXT NOT NULL, state TEXT NOT NULL, "
       "updated_at_ms INTEGER NOT NULL, PRIMARY KEY (tenant, id));"
       "CREATE TABLE IF NOT EXISTS tenant_config (tenant TEXT PRIMARY KEY, tier TEXT NOT NULL DEFAULT 'free', "
       "alert_webhook_url TEXT, updated_at_ms INTEGER NOT NULL);"},
      {2,
       "CREATE TABLE IF NOT EXISTS facts (seq INTEGER PRIMARY KEY AUTOINCREMENT, tenant TEXT NOT NULL, ts_ms INTEGER NOT NULL, "
       "source TEXT NOT NULL, type TEXT NOT NULL, entity TEXT NOT NULL, meta_json TEXT);"
       "CREATE INDEX IF NOT EXISTS facts_tenant_seq ON facts (tenant, seq);"},
  };
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "CREATE TABLE IF NOT EXISTS clients (tenant TEXT NOT NULL, id TEXT NOT NULL, last_seen_ms BIGINT NOT NULL, "
       "source_ip TEXT, user_agent TEXT, meta_json JSONB, verified BOOLEAN NOT NULL DEFAULT FALSE, PRIMARY KEY (tenant, id));"
       "CREATE TABLE IF NOT EXISTS client_index (seq BIGSERIAL PRIMARY KEY, tenant TEXT NOT NULL, id TEXT NOT NULL, "
       "UNIQUE(tenant, id));"
       "CREATE TABLE IF NOT EXISTS client_state (tenant TEXT NOT NULL, id TEXT NOT NULL, state TEXT NOT NULL, "
       "updated_at_ms BIGINT NOT NULL, PRIMARY KEY (tenant, id));"
       "CREATE TABLE IF NOT EXISTS tenant_config (tenant TEXT PRIMARY KEY, tier TEXT NOT NULL DEFAULT 'free', "
       "alert_webhook_url TEXT, updated_at_ms BIGINT NOT NULL);"},
      {2,
       "CREATE TABLE IF NOT EXISTS facts (seq BIGSERIAL PRIMARY KEY, tenant TEXT NOT NULL, ts_ms BIGINT NOT NULL, "
       "source TEXT NOT NULL, type TEXT NOT NULL, entity TEXT NOT NULL, meta_json JSONB);"
       "CREATE INDEX IF NOT EXISTS facts_tenant_seq ON facts (tenant, seq);"},
  };
  return kMigrations;
}

} // namespace heartbeat::db::sql
