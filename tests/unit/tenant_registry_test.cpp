#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/tenant/tenant_registry.hpp"

namespace {

using heartbeat::db::memory::MemoryRepository;
using heartbeat::tenant::TenantRegistry;

void TestSameTenantSharesContext() {
  TenantRegistry registry(std::make_shared<MemoryRepository>(), 4);

  auto a = registry.Acquire("acme");
  auto b = registry.Acquire("acme");
  auto c = registry.Acquire("globex");

  assert(a == b);
  assert(a != c);
  assert(a->tenant == "acme");
  assert(a->store->Tenant() == "acme");
  assert(registry.CachedCount() == 2);
}

void TestIdleContextsEvictedLeastRecentFirst() {
  TenantRegistry registry(std::make_shared<MemoryRepository>(), 2);

  std::weak_ptr<heartbeat::tenant::TenantContext> first;
  {
    auto a = registry.Acquire("a");
    first  = a;
  }
  (void)registry.Acquire("b");
  (void)registry.Acquire("a"); // a becomes most recent
  (void)registry.Acquire("c"); // evicts b

  assert(registry.CachedCount() == 2);
  assert(!first.expired());
  assert(registry.Acquire("a") == first.lock());
}

void TestInUseContextSurvivesEviction() {
  TenantRegistry registry(std::make_shared<MemoryRepository>(), 1);

  auto held = registry.Acquire("held");
  (void)registry.Acquire("other");

  // "held" could not be evicted, so the cache is over capacity until released
  assert(registry.Acquire("held") == held);

  held.reset();
  (void)registry.Acquire("third");
  assert(registry.CachedCount() == 1);
}

void TestEvictedTenantRebuildsFromStore() {
  auto           repository = std::make_shared<MemoryRepository>();
  TenantRegistry registry(repository, 1);

  {
    auto ctx = registry.Acquire("acme");

    heartbeat::db::model::ClientRecord record;
    record.id           = "s1";
    record.last_seen_ms = 42;
    ctx->store->PutRecord(record);
  }

  (void)registry.Acquire("globex"); // evicts acme

  auto again = registry.Acquire("acme");
  auto found = again->store->GetRecord("s1");
  assert(found.has_value());
  assert(found->last_seen_ms == 42);
  assert(!again->config.has_value());
}

void TestConcurrentAcquireReturnsOneContext() {
  TenantRegistry registry(std::make_shared<MemoryRepository>(), 8);

  std::vector<std::shared_ptr<heartbeat::tenant::TenantContext>> seen(8);
  std::vector<std::thread>                                       threads;
  for (std::size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&, i] { seen[i] = registry.Acquire("shared"); });
  }
  for (auto& t : threads) t.join();

  for (const auto& ctx : seen) {
    assert(ctx == seen[0]);
  }
}

} // namespace

int main() {
  TestSameTenantSharesContext();
  TestIdleContextsEvictedLeastRecentFirst();
  TestInUseContextSurvivesEviction();
  TestEvictedTenantRebuildsFromStore();
  TestConcurrentAcquireReturnsOneContext();

  std::cout << "heartbeat_unit_tenant_registry: pass\n";
  return 0;
}
