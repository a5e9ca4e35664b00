#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace heartbeat::security {

// Allowed distance between the signed timestamp and the server clock.
inline constexpr int64_t kMaxClockSkewMs = 300'000;

/*
  HMAC-SHA256 proof that a ping was produced by a holder of the shared
  secret within the skew window.

  Signed message: "{tenant}\n{id}\n{timestamp}" using the timestamp text
  exactly as received. Signatures are lowercase hex on output and
  compared case-insensitively.
*/

// Returns normally when the proof is valid, throws otherwise:
//   ConfigError            secret is empty
//   MissingFieldError      timestamp or signature absent/blank
//   InvalidTimestampError  timestamp is not a finite number
//   SkewError              |now - timestamp| > kMaxClockSkewMs
//   BadSignatureError      signature mismatch
void Verify(std::string_view                  secret,
            std::string_view                  tenant,
            std::string_view                  id,
            const std::optional<std::string>& timestamp,
            const std::optional<std::string>& signature,
            int64_t                           now_ms);

std::string Sign(std::string_view secret, std::string_view tenant, std::string_view id, std::string_view timestamp);

// Constant time in content; only a length mismatch returns early.
bool ConstantTimeEqualsIgnoreCase(std::string_view a, std::string_view b);

} // namespace heartbeat::security
