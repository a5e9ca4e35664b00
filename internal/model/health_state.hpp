#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace heartbeat::model {

enum class HealthState : std::uint8_t {
  kUnknown = 0,
  kOk      = 1,
  kWarn    = 2,
  kDown    = 3,
};

// Half-open age bands: [0, warn) OK, [warn, down) WARN, [down, inf) DOWN.
inline constexpr std::int64_t kWarnAfterMs = 60'000;
inline constexpr std::int64_t kDownAfterMs = 300'000;

constexpr HealthState Classify(std::int64_t age_ms) {
  if (age_ms < kWarnAfterMs) {
    return HealthState::kOk;
  }
  if (age_ms < kDownAfterMs) {
    return HealthState::kWarn;
  }
  return HealthState::kDown;
}

constexpr std::string_view ToString(HealthState state) {
  switch (state) {
    case HealthState::kOk:
      return "OK";
    case HealthState::kWarn:
      return "WARN";
    case HealthState::kDown:
      return "DOWN";
    case HealthState::kUnknown:
    default:
      return "UNKNOWN";
  }
}

constexpr std::optional<HealthState> ParseHealthState(std::string_view value) {
  if (value == "OK") return HealthState::kOk;
  if (value == "WARN") return HealthState::kWarn;
  if (value == "DOWN") return HealthState::kDown;
  if (value == "UNKNOWN") return HealthState::kUnknown;
  return std::nullopt;
}

} // namespace heartbeat::model
