#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>

#include "heartbeat/v1.hpp"
#include "internal/db/model/client_record.hpp"
#include "internal/db/model/fact_record.hpp"
#include "internal/db/model/tenant_config_record.hpp"
#include "internal/model/health_state.hpp"
#include "internal/model/tier.hpp"

namespace heartbeat::core {

/*
  Storage record <-> wire message mapping.

  meta values are kept as canonical JSON text in storage and as
  google.protobuf.Value on the wire; nothing inspects their contents.
*/

// An unset Value encodes as "null". Throws util::ValidationError when the
// value has no JSON form.
std::string EncodeMeta(const google::protobuf::Value& meta);
// Empty stored text decodes to null.
google::protobuf::Value DecodeMeta(const std::string& json);

heartbeat::v1::HealthState ToProto(model::HealthState state);
heartbeat::v1::Tier        ToProto(model::Tier tier);

heartbeat::v1::ClientRecord ToProto(const db::model::ClientRecord& record);
heartbeat::v1::TenantConfig ToProto(const db::model::TenantConfigRecord& config);
heartbeat::v1::Fact         ToProto(const db::model::FactRecord& fact);

} // namespace heartbeat::core
