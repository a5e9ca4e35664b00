#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace heartbeat::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct TenantState {
    std::unordered_map<std::string, model::ClientRecord> clients;
    std::vector<std::string> client_index;
    std::unordered_map<std::string, model::ClientStateRecord> states;
    std::optional<model::TenantConfigRecord> config;

    // oldest first
    std::deque<model::FactRecord> facts;
    uint64_t next_fact_seq = 1;

    uint64_t version = 0;
  };

  std::mutex mutex_;
  // Committed partitions are immutable once published; readers share them.
  std::unordered_map<std::string, std::shared_ptr<const TenantState>> committed_;
};

}
