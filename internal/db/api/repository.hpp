#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/client_record.hpp"
#include "internal/db/model/client_state_record.hpp"
#include "internal/db/model/fact_record.hpp"
#include "internal/db/model/tenant_config_record.hpp"

namespace heartbeat::db {

/*
  Repository abstraction.

  Every row is partitioned by tenant; no method ever reads across tenants.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpsertClient writes the record and its index entry atomically;
    the index is append-only and keeps first-seen order
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Client records + index
  // ---------------------------------------------------------------------

  // Overwrites the record; appends the id to the tenant index if new.
  virtual Result UpsertClient(Transaction&, const model::ClientRecord&) = 0;

  virtual std::optional<model::ClientRecord> GetClient(Transaction&, const std::string& tenant, const std::string& id) = 0;

  // Ids in first-seen order.
  virtual std::vector<std::string> ListClientIds(Transaction&, const std::string& tenant) = 0;

  // ---------------------------------------------------------------------
  // Last known state
  // ---------------------------------------------------------------------

  virtual Result PutClientState(Transaction&, const model::ClientStateRecord&) = 0;

  virtual std::optional<model::ClientStateRecord> GetClientState(Transaction&, const std::string& tenant, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Tenant config
  // ---------------------------------------------------------------------

  virtual Result UpsertTenantConfig(Transaction&, const model::TenantConfigRecord&) = 0;

  virtual std::optional<model::TenantConfigRecord> GetTenantConfig(Transaction&, const std::string& tenant) = 0;

  // ---------------------------------------------------------------------
  // Facts
  // ---------------------------------------------------------------------

  virtual Result AppendFact(Transaction&, const model::FactRecord&) = 0;

  // Keeps only the newest max_entries facts of the tenant.
  virtual Result TrimFactsToMaxCount(Transaction&, const std::string& tenant, uint64_t max_entries) = 0;

  // Newest first.
  virtual std::vector<model::FactRecord> ListFacts(Transaction&, const std::string& tenant) = 0;
};

} // namespace heartbeat::db
