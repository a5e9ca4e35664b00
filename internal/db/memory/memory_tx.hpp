#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace heartbeat::db::memory {

/*
  Transaction = per-tenant snapshot + write set

  Reads pin the committed partition without copying it; a partition is
  copied only on the first Mutable() call. Commit fails with a retryable
  StorageError only when a concurrent transaction committed a partition
  this one wrote.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  MemoryRepository::TenantState& Mutable(const std::string& tenant);
  const MemoryRepository::TenantState& View(const std::string& tenant);

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  using Snapshot = std::shared_ptr<const MemoryRepository::TenantState>;

  const Snapshot& Pin(const std::string& tenant);

  MemoryRepository& repo_;

  std::unordered_map<std::string, Snapshot> snapshots_;
  std::unordered_map<std::string, MemoryRepository::TenantState> working_;
};

} // namespace heartbeat::db::memory
