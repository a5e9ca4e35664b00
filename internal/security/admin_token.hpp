#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace heartbeat::security {

// Throws ConfigError when no token is configured on the host and
// AuthError when the presented token is missing or wrong.
void RequireAdminToken(std::string_view configured, const std::optional<std::string>& presented);

} // namespace heartbeat::security
