#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace heartbeat::db::model {

struct TenantConfigRecord {
  std::string tenant;

  // "free" | "premium"
  std::string tier = "free";

  std::optional<std::string> alert_webhook_url;

  int64_t updated_at_ms = 0;
};

} // namespace heartbeat::db::model
