#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/model/tenant_config_record.hpp"
#include "internal/tenant/tenant_store.hpp"

namespace heartbeat::db {
class Repository;
}

namespace heartbeat::tenant {

/*
  Per-tenant state bundle.

  mutex serializes every read-modify-write on the tenant's records.
  config is a cache of the stored config, guarded by mutex; empty until
  first read and replaced on every config write.
*/
struct TenantContext {
  TenantContext(std::string tenant_key, std::shared_ptr<TenantStore> tenant_store)
      : tenant(std::move(tenant_key)), store(std::move(tenant_store)) {
  }

  const std::string                            tenant;
  const std::shared_ptr<TenantStore>           store;
  std::mutex                                   mutex;
  std::optional<db::model::TenantConfigRecord> config;
};

/*
  Owns TenantContext values, at most one live per tenant while cached.

  Bounded LRU. Only contexts nobody else holds are evicted, so two
  in-flight requests for one tenant always share a mutex. When every
  cached context is in use the cache grows past capacity until one is
  released.
*/
class TenantRegistry {
 public:
  TenantRegistry(std::shared_ptr<db::Repository> repository, std::size_t max_cached_contexts);

  std::shared_ptr<TenantContext> Acquire(const std::string& tenant);

  std::size_t CachedCount() const;

 private:
  struct Entry {
    std::shared_ptr<TenantContext>   context;
    std::list<std::string>::iterator lru_position;
  };

  void EvictIdleLocked();

  std::shared_ptr<db::Repository> repository_;
  std::size_t                     max_cached_contexts_;

  mutable std::mutex                     mutex_;
  std::list<std::string>                 lru_; // most recent first
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace heartbeat::tenant
