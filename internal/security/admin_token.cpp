#include "internal/security/admin_token.hpp"

#include <openssl/crypto.h>

#include "internal/util/errors.hpp"

namespace heartbeat::security {

void RequireAdminToken(std::string_view configured, const std::optional<std::string>& presented) {
  if (configured.empty()) {
    throw util::ConfigError("admin token not configured");
  }
  if (!presented || presented->size() != configured.size() ||
      CRYPTO_memcmp(presented->data(), configured.data(), configured.size()) != 0) {
    throw util::UnauthorizedError("unauthorized");
  }
}

} // namespace heartbeat::security
