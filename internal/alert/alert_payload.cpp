#include "alert_payload.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace heartbeat::alert {

std::string BuildStateChangePayload(const std::string& tenant,
                                    const std::string& id,
                                    model::HealthState from,
                                    model::HealthState to,
                                    int64_t            age_ms,
                                    int64_t            at_ms) {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["event"].set_string_value("state_change");
  fields["tenant"].set_string_value(tenant);
  fields["id"].set_string_value(id);
  fields["from"].set_string_value(std::string(model::ToString(from)));
  fields["to"].set_string_value(std::string(model::ToString(to)));
  fields["age_ms"].set_number_value(static_cast<double>(age_ms));
  fields["at"].set_number_value(static_cast<double>(at_ms));

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode alert payload: " + std::string(status.message()));
  }
  return json;
}

} // namespace heartbeat::alert
