#include "internal/tenant/tenant_store.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heartbeat::tenant {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (!result) {
    throw util::StorageError(context + ": " + result.Describe(), result.Retryable());
  }
}

} // namespace

TenantStore::TenantStore(std::shared_ptr<db::Repository> repository, std::string tenant)
    : repository_(std::move(repository)), tenant_(std::move(tenant)) {
  if (!repository_) {
    throw std::invalid_argument("tenant store requires repository");
  }
}

void TenantStore::PutRecord(db::model::ClientRecord record) {
  record.tenant = tenant_;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertClient(*tx, record), "put client record");
  tx->Commit();
}

std::optional<db::model::ClientRecord> TenantStore::GetRecord(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetClient(*tx, tenant_, id);
  tx->Commit();
  return record;
}

std::vector<std::string> TenantStore::ListIds() {
  auto tx  = repository_->Begin();
  auto ids = repository_->ListClientIds(*tx, tenant_);
  tx->Commit();
  return ids;
}

std::vector<db::model::ClientRecord> TenantStore::ListRecords() {
  auto tx = repository_->Begin();

  std::vector<db::model::ClientRecord> records;
  for (const auto& id : repository_->ListClientIds(*tx, tenant_)) {
    auto record = repository_->GetClient(*tx, tenant_, id);
    if (!record) {
      // index and record are written together; a gap means a foreign writer
      HEARTBEAT_LOG_WARN("indexed client without record", {observability::StringField("tenant", tenant_), observability::StringField("id", id)});
      continue;
    }
    records.push_back(std::move(*record));
  }

  tx->Commit();
  return records;
}

db::model::TenantConfigRecord TenantStore::GetConfig() {
  auto tx     = repository_->Begin();
  auto config = repository_->GetTenantConfig(*tx, tenant_);
  tx->Commit();

  if (config) {
    return *config;
  }

  db::model::TenantConfigRecord defaults;
  defaults.tenant = tenant_;
  return defaults;
}

void TenantStore::PutConfig(db::model::TenantConfigRecord config) {
  config.tenant = tenant_;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertTenantConfig(*tx, config), "put tenant config");
  tx->Commit();
}

std::optional<model::HealthState> TenantStore::GetLastState(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetClientState(*tx, tenant_, id);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }
  return model::ParseHealthState(record->state);
}

void TenantStore::PutLastState(const std::string& id, model::HealthState state, int64_t now_ms) {
  db::model::ClientStateRecord record;
  record.tenant        = tenant_;
  record.id            = id;
  record.state         = std::string(model::ToString(state));
  record.updated_at_ms = now_ms;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->PutClientState(*tx, record), "put last known state");
  tx->Commit();
}

void TenantStore::AppendFact(db::model::FactRecord fact, uint64_t max_entries) {
  fact.tenant = tenant_;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->AppendFact(*tx, fact), "append fact");
  ThrowIfDbError(repository_->TrimFactsToMaxCount(*tx, tenant_, max_entries), "trim facts");
  tx->Commit();
}

std::vector<db::model::FactRecord> TenantStore::ListFacts() {
  auto tx    = repository_->Begin();
  auto facts = repository_->ListFacts(*tx, tenant_);
  tx->Commit();
  return facts;
}

} // namespace heartbeat::tenant
