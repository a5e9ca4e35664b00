#pragma once

#include <cstdint>
#include <string_view>

namespace heartbeat::model {

enum class Tier : std::uint8_t {
  kFree    = 0,
  kPremium = 1,
};

constexpr std::string_view ToString(Tier tier) {
  switch (tier) {
    case Tier::kPremium:
      return "premium";
    case Tier::kFree:
    default:
      return "free";
  }
}

// Unrecognised values fall back to free rather than failing.
constexpr Tier ParseTier(std::string_view value) {
  return value == "premium" ? Tier::kPremium : Tier::kFree;
}

constexpr bool IsKnownTier(std::string_view value) {
  return value == "free" || value == "premium";
}

} // namespace heartbeat::model
