#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/client_record.hpp"
#include "internal/db/model/fact_record.hpp"
#include "internal/db/model/tenant_config_record.hpp"
#include "internal/model/health_state.hpp"

namespace heartbeat::db {
class Repository;
}

namespace heartbeat::tenant {

/*
  Tenant-scoped facade over the repository.

  Every call runs in its own transaction and commits before returning,
  so callers always read their own writes. Failed writes throw
  std::runtime_error.

  Not synchronized: callers serialize read-modify-write sequences on the
  owning TenantContext mutex.
*/
class TenantStore {
 public:
  TenantStore(std::shared_ptr<db::Repository> repository, std::string tenant);

  const std::string& Tenant() const {
    return tenant_;
  }

  // Overwrites the record and appends its id to the index if new.
  void PutRecord(db::model::ClientRecord record);

  std::optional<db::model::ClientRecord> GetRecord(const std::string& id);

  std::vector<std::string> ListIds();

  // Records in index order, read in one transaction.
  std::vector<db::model::ClientRecord> ListRecords();

  // Default {free, no webhook, 0} when the tenant was never configured.
  db::model::TenantConfigRecord GetConfig();
  void PutConfig(db::model::TenantConfigRecord config);

  std::optional<model::HealthState> GetLastState(const std::string& id);
  void PutLastState(const std::string& id, model::HealthState state, int64_t now_ms);

  // Append and trim to max_entries in one transaction.
  void AppendFact(db::model::FactRecord fact, uint64_t max_entries);

  // Newest first.
  std::vector<db::model::FactRecord> ListFacts();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     tenant_;
};

} // namespace heartbeat::tenant
