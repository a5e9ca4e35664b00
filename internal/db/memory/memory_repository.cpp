#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace heartbeat::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertClient(Transaction& t, const model::ClientRecord& r) {
  auto& s = TX(t).Mutable(r.tenant);
  if (!s.clients.contains(r.id)) s.client_index.push_back(r.id);
  s.clients[r.id] = r;
  return Result::Ok();
}

std::optional<model::ClientRecord> MemoryRepository::GetClient(Transaction& t, const std::string& tenant, const std::string& id) {
  const auto& s  = TX(t).View(tenant);
  auto        it = s.clients.find(id);
  if (it == s.clients.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> MemoryRepository::ListClientIds(Transaction& t, const std::string& tenant) {
  return TX(t).View(tenant).client_index;
}

Result MemoryRepository::PutClientState(Transaction& t, const model::ClientStateRecord& r) {
  TX(t).Mutable(r.tenant).states[r.id] = r;
  return Result::Ok();
}

std::optional<model::ClientStateRecord> MemoryRepository::GetClientState(Transaction& t, const std::string& tenant, const std::string& id) {
  const auto& s  = TX(t).View(tenant);
  auto        it = s.states.find(id);
  if (it == s.states.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertTenantConfig(Transaction& t, const model::TenantConfigRecord& r) {
  TX(t).Mutable(r.tenant).config = r;
  return Result::Ok();
}

std::optional<model::TenantConfigRecord> MemoryRepository::GetTenantConfig(Transaction& t, const std::string& tenant) {
  return TX(t).View(tenant).config;
}

Result MemoryRepository::AppendFact(Transaction& t, const model::FactRecord& r) {
  auto& s    = TX(t).Mutable(r.tenant);
  auto  fact = r;
  fact.seq   = s.next_fact_seq++;
  s.facts.push_back(std::move(fact));
  return Result::Ok();
}

Result MemoryRepository::TrimFactsToMaxCount(Transaction& t, const std::string& tenant, uint64_t max_entries) {
  auto& s = TX(t).Mutable(tenant);
  while (s.facts.size() > max_entries) {
    s.facts.pop_front();
  }
  return Result::Ok();
}

std::vector<model::FactRecord> MemoryRepository::ListFacts(Transaction& t, const std::string& tenant) {
  const auto& s = TX(t).View(tenant);
  return {s.facts.rbegin(), s.facts.rend()};
}

} // namespace heartbeat::db::memory
