#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace heartbeat::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertClient(Transaction&, const model::ClientRecord&) override;
  std::optional<model::ClientRecord> GetClient(Transaction&, const std::string& tenant, const std::string& id) override;
  std::vector<std::string> ListClientIds(Transaction&, const std::string& tenant) override;

  Result PutClientState(Transaction&, const model::ClientStateRecord&) override;
  std::optional<model::ClientStateRecord> GetClientState(Transaction&, const std::string& tenant, const std::string& id) override;

  Result UpsertTenantConfig(Transaction&, const model::TenantConfigRecord&) override;
  std::optional<model::TenantConfigRecord> GetTenantConfig(Transaction&, const std::string& tenant) override;

  Result AppendFact(Transaction&, const model::FactRecord&) override;
  Result TrimFactsToMaxCount(Transaction&, const std::string& tenant, uint64_t max_entries) override;
  std::vector<model::FactRecord> ListFacts(Transaction&, const std::string& tenant) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
