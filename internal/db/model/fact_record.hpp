#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace heartbeat::db::model {

struct FactRecord {
  std::string tenant;

  // Assigned by the backend on append; orders facts within a tenant.
  uint64_t seq = 0;

  int64_t     ts_ms = 0;
  std::string source;
  std::string type;
  std::string entity;

  std::optional<std::string> meta_json;
};

} // namespace heartbeat::db::model
