#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/alert/alert_dispatcher.hpp"
#include "internal/alert/alert_queue.hpp"
#include "internal/alert/alert_worker.hpp"
#include "internal/alert/webhook_sender.hpp"
#include "internal/core/heartbeat_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/facts/facts_log.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/facts_server.hpp"
#include "internal/grpc/heartbeat_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/facts_service.hpp"
#include "internal/service/heartbeat_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/tenant/tenant_registry.hpp"
#include "internal/util/time.hpp"
#if HEARTBEAT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migration_executor.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if HEARTBEAT_DB_POSTGRES
#include "internal/db/postgres/pg_migration_executor.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace heartbeat::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const heartbeat::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if HEARTBEAT_DB_SQLITE
    auto                            sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::SqliteMigrationExecutor executor(sqlite_db);
    const int applied = db::sql::RunMigrations(executor, db::sql::SqliteMigrations());
    HEARTBEAT_LOG_INFO("sqlite repository ready",
                       {observability::StringField("path", database.sqlite().path()), observability::IntField("migrations_applied", applied)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if HEARTBEAT_DB_POSTGRES
    const auto& pg = database.postgres();
    {
      db::postgres::PgMigrationExecutor executor(pg.connection_uri());
      const int applied = db::sql::RunMigrations(executor, db::sql::PostgresMigrations());
      HEARTBEAT_LOG_INFO("postgres schema ready", {observability::IntField("migrations_applied", applied)});
    }
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  HEARTBEAT_LOG_WARN("no database configured, state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const heartbeat::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto registry   = std::make_shared<tenant::TenantRegistry>(repository, config.tenants().max_cached_contexts());

  // ------------------------------------------------------------------
  // Alert delivery
  // ------------------------------------------------------------------
  const auto& alerts = config.alerts();
  auto        queue  = std::make_shared<alert::AlertQueue>(alerts.queue_capacity());
  auto        sender = std::make_shared<alert::CurlWebhookSender>(alerts.timeout_ms());

  app.alert_worker = std::make_shared<alert::AlertWorker>(queue, sender, alerts.workers());
  app.alert_worker->Start();

  auto dispatcher = std::make_shared<alert::QueuedAlertDispatcher>(queue);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto clock = std::make_shared<const util::SystemClock>();

  if (config.security().signing_secret().empty()) {
    HEARTBEAT_LOG_WARN("no signing secret configured, pings are never verified");
  }
  if (config.security().admin_token().empty()) {
    HEARTBEAT_LOG_WARN("no admin token configured, SetConfig is disabled");
  }

  auto engine = std::make_shared<core::HeartbeatEngine>(registry, dispatcher, clock, config.security().signing_secret());
  auto facts  = std::make_shared<facts::FactsLog>(registry, clock);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine         = engine;
  ctx.facts          = facts;
  ctx.default_tenant = config.tenants().default_tenant();
  ctx.admin_token    = config.security().admin_token();

  auto heartbeat_service = std::make_shared<service::HeartbeatService>(ctx);
  auto admin_service     = std::make_shared<service::AdminService>(ctx);
  auto facts_service     = std::make_shared<service::FactsService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::HeartbeatServer>(heartbeat_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));
  app.grpc_services.push_back(std::make_unique<grpc::FactsServer>(facts_service));

  return app;
}

} // namespace heartbeat::factory
