#pragma once

#include <cstdint>
#include <string>

namespace heartbeat::db::model {

/*
  Last computed-and-persisted classifier output for a client.

  Only used to detect transitions; it lags the real state between polls.
  state holds the model::HealthState spelling (OK/WARN/DOWN).
*/

struct ClientStateRecord {
  std::string tenant;
  std::string id;
  std::string state;
  int64_t     updated_at_ms = 0;
};

} // namespace heartbeat::db::model
