#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace heartbeat::db::model {

/*
  Latest ping of one client. Overwritten on every ping, never merged.

  meta_json holds the canonical JSON text of the client's opaque value:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string
*/

struct ClientRecord {
  std::string tenant;
  std::string id;

  int64_t last_seen_ms = 0;

  std::optional<std::string> source_ip;
  std::optional<std::string> user_agent;
  std::optional<std::string> meta_json;

  bool verified = false;
};

} // namespace heartbeat::db::model
