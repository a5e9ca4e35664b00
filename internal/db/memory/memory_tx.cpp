#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace heartbeat::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {}

MemoryTransaction::~MemoryTransaction() {
  if (!IsFinished()) DoRollback();
}

const MemoryTransaction::Snapshot& MemoryTransaction::Pin(const std::string& tenant) {
  auto it = snapshots_.find(tenant);
  if (it != snapshots_.end()) return it->second;

  static const Snapshot kEmpty = std::make_shared<const MemoryRepository::TenantState>();

  std::scoped_lock lock(repo_.mutex_);
  auto committed = repo_.committed_.find(tenant);
  return snapshots_.emplace(tenant, committed != repo_.committed_.end() ? committed->second : kEmpty).first->second;
}

MemoryRepository::TenantState& MemoryTransaction::Mutable(const std::string& tenant) {
  auto it = working_.find(tenant);
  if (it != working_.end()) return it->second;
  return working_.emplace(tenant, *Pin(tenant)).first->second; // copy on write
}

const MemoryRepository::TenantState& MemoryTransaction::View(const std::string& tenant) {
  if (auto it = working_.find(tenant); it != working_.end()) return it->second;
  return *Pin(tenant);
}

void MemoryTransaction::DoCommit() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [tenant, state] : working_) {
    uint64_t current = 0;
    if (auto it = repo_.committed_.find(tenant); it != repo_.committed_.end()) current = it->second->version;
    if (current != snapshots_.at(tenant)->version) {
      throw util::StorageError("transaction conflict: tenant '" + tenant + "' was modified by a concurrent transaction", true);
    }
  }
  for (auto& [tenant, state] : working_) {
    state.version            = snapshots_.at(tenant)->version + 1;
    repo_.committed_[tenant] = std::make_shared<const MemoryRepository::TenantState>(std::move(state));
  }
  working_.clear();
  snapshots_.clear();
}

void MemoryTransaction::DoRollback() {
  working_.clear();
  snapshots_.clear();
}

} // namespace heartbeat::db::memory
