#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/facts/facts_log.hpp"
#include "internal/tenant/tenant_registry.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using heartbeat::facts::FactsLog;
using heartbeat::testing::ManualClock;

struct Fixture {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(1'000'000);
  std::shared_ptr<heartbeat::tenant::TenantRegistry> registry =
      std::make_shared<heartbeat::tenant::TenantRegistry>(std::make_shared<heartbeat::db::memory::MemoryRepository>(), 16);
  FactsLog log{registry, clock};
};

void TestRecordTrimsAndStamps() {
  Fixture f;

  auto fact = f.log.RecordFact("acme", "  scanner ", "port_open", " host-1 ", std::nullopt);
  assert(fact.source() == "scanner");
  assert(fact.type() == "port_open");
  assert(fact.entity() == "host-1");
  assert(fact.ts_ms() == 1'000'000);
  assert(!fact.has_meta());
}

void TestBlankFieldsRejected() {
  Fixture f;

  for (int blank = 0; blank < 3; ++blank) {
    bool threw = false;
    try {
      (void)f.log.RecordFact("acme", blank == 0 ? " " : "s", blank == 1 ? "" : "t", blank == 2 ? "\t" : "e", std::nullopt);
    } catch (const heartbeat::util::MissingFieldError&) {
      threw = true;
    }
    assert(threw);
  }
  assert(f.log.ListFacts("acme").empty());
}

void TestMetaPassedThrough() {
  Fixture f;

  google::protobuf::Value meta;
  auto&                   fields = *meta.mutable_struct_value()->mutable_fields();
  fields["port"].set_number_value(22);
  fields["proto"].set_string_value("tcp");

  (void)f.log.RecordFact("acme", "scanner", "port_open", "host-1", meta);

  auto facts = f.log.ListFacts("acme");
  assert(facts.size() == 1);
  assert(facts[0].meta().struct_value().fields().at("port").number_value() == 22);
  assert(facts[0].meta().struct_value().fields().at("proto").string_value() == "tcp");
}

void TestCapKeepsNewestTwoHundred() {
  Fixture f;

  for (int i = 0; i < 205; ++i) {
    (void)f.log.RecordFact("acme", "src", "type", "entity-" + std::to_string(i), std::nullopt);
    f.clock->Advance(1);
  }

  auto facts = f.log.ListFacts("acme");
  assert(facts.size() == heartbeat::facts::kMaxFacts);
  assert(facts.front().entity() == "entity-204");
  assert(facts.back().entity() == "entity-5");
  for (std::size_t i = 1; i < facts.size(); ++i) {
    assert(facts[i - 1].ts_ms() > facts[i].ts_ms());
  }
}

void TestTenantsIsolated() {
  Fixture f;

  (void)f.log.RecordFact("acme", "src", "type", "a", std::nullopt);
  (void)f.log.RecordFact("globex", "src", "type", "g", std::nullopt);

  auto acme = f.log.ListFacts("acme");
  assert(acme.size() == 1);
  assert(acme[0].entity() == "a");
  assert(f.log.ListFacts("initech").empty());
}

void TestUnsetMetaListsAsNull() {
  Fixture f;

  auto fact = f.log.RecordFact("acme", "scanner", "port_open", "host-1", google::protobuf::Value{});
  assert(fact.meta().kind_case() == google::protobuf::Value::kNullValue);

  const auto listed = f.log.ListFacts("acme");
  assert(listed.size() == 1);
  assert(listed[0].meta().kind_case() == google::protobuf::Value::kNullValue);
}

} // namespace

int main() {
  TestRecordTrimsAndStamps();
  TestBlankFieldsRejected();
  TestMetaPassedThrough();
  TestCapKeepsNewestTwoHundred();
  TestTenantsIsolated();
  TestUnsetMetaListsAsNull();

  std::cout << "heartbeat_unit_facts_log: pass\n";
  return 0;
}
