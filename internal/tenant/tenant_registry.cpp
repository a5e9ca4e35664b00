#include "internal/tenant/tenant_registry.hpp"

#include <stdexcept>

namespace heartbeat::tenant {

TenantRegistry::TenantRegistry(std::shared_ptr<db::Repository> repository, std::size_t max_cached_contexts)
    : repository_(std::move(repository)), max_cached_contexts_(max_cached_contexts == 0 ? 1 : max_cached_contexts) {
  if (!repository_) {
    throw std::invalid_argument("tenant registry requires repository");
  }
}

std::shared_ptr<TenantContext> TenantRegistry::Acquire(const std::string& tenant) {
  std::lock_guard lock(mutex_);

  if (auto it = entries_.find(tenant); it != entries_.end()) {
    lru_.splice(lru_.begin(), lru_, it->second.lru_position);
    return it->second.context;
  }

  auto context = std::make_shared<TenantContext>(tenant, std::make_shared<TenantStore>(repository_, tenant));
  lru_.push_front(tenant);
  entries_.emplace(tenant, Entry{context, lru_.begin()});

  EvictIdleLocked();
  return context;
}

std::size_t TenantRegistry::CachedCount() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void TenantRegistry::EvictIdleLocked() {
  auto it = lru_.end();
  while (entries_.size() > max_cached_contexts_ && it != lru_.begin()) {
    --it;
    auto entry = entries_.find(*it);
    if (entry->second.context.use_count() > 1) {
      continue;
    }
    entries_.erase(entry);
    it = lru_.erase(it);
  }
}

} // namespace heartbeat::tenant
