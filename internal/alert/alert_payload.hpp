#pragma once

#include <cstdint>
#include <string>

#include "internal/model/health_state.hpp"

namespace heartbeat::alert {

// {"event":"state_change","tenant","id","from","to","age_ms","at"} as JSON text.
std::string BuildStateChangePayload(const std::string& tenant,
                                    const std::string& id,
                                    model::HealthState from,
                                    model::HealthState to,
                                    int64_t            age_ms,
                                    int64_t            at_ms);

} // namespace heartbeat::alert
