#include <cassert>
#include <iostream>

#include "internal/core/proto_mapping.hpp"
#include "internal/model/health_state.hpp"
#include "internal/model/tier.hpp"

namespace {

using heartbeat::model::Classify;
using heartbeat::model::HealthState;

static_assert(Classify(0) == HealthState::kOk);
static_assert(Classify(300'000) == HealthState::kDown);

void TestClassifyBoundaries() {
  assert(Classify(0) == HealthState::kOk);
  assert(Classify(59'999) == HealthState::kOk);
  assert(Classify(60'000) == HealthState::kWarn);
  assert(Classify(299'999) == HealthState::kWarn);
  assert(Classify(300'000) == HealthState::kDown);
  assert(Classify(86'400'000) == HealthState::kDown);
}

void TestClassifyBands() {
  for (int64_t age = 0; age < 60'000; age += 997) {
    assert(Classify(age) == HealthState::kOk);
  }
  for (int64_t age = 60'000; age < 300'000; age += 4'999) {
    assert(Classify(age) == HealthState::kWarn);
  }
  for (int64_t age = 300'000; age < 3'000'000; age += 49'999) {
    assert(Classify(age) == HealthState::kDown);
  }
}

void TestStateNames() {
  using heartbeat::model::ParseHealthState;
  using heartbeat::model::ToString;

  assert(ToString(HealthState::kOk) == "OK");
  assert(ToString(HealthState::kWarn) == "WARN");
  assert(ToString(HealthState::kDown) == "DOWN");
  assert(ToString(HealthState::kUnknown) == "UNKNOWN");

  assert(ParseHealthState("WARN") == HealthState::kWarn);
  assert(!ParseHealthState("warn").has_value());
  assert(!ParseHealthState("").has_value());
}

void TestTierParsing() {
  using heartbeat::model::IsKnownTier;
  using heartbeat::model::ParseTier;
  using heartbeat::model::Tier;

  assert(ParseTier("premium") == Tier::kPremium);
  assert(ParseTier("free") == Tier::kFree);
  assert(ParseTier("gold") == Tier::kFree);
  assert(ParseTier("") == Tier::kFree);
  assert(IsKnownTier("free"));
  assert(!IsKnownTier("Premium"));
}

void TestProtoEnums() {
  using heartbeat::core::ToProto;

  assert(ToProto(HealthState::kOk) == heartbeat::v1::HEALTH_STATE_OK);
  assert(ToProto(HealthState::kDown) == heartbeat::v1::HEALTH_STATE_DOWN);
  assert(ToProto(heartbeat::model::Tier::kPremium) == heartbeat::v1::TIER_PREMIUM);
}

} // namespace

int main() {
  TestClassifyBoundaries();
  TestClassifyBands();
  TestStateNames();
  TestTierParsing();
  TestProtoEnums();

  std::cout << "heartbeat_unit_health_state: pass\n";
  return 0;
}
