#include "internal/core/proto_mapping.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace heartbeat::core {

std::string EncodeMeta(const google::protobuf::Value& meta) {
  // A Value with no kind set serializes to nothing; store it as JSON null.
  if (meta.kind_case() == google::protobuf::Value::KIND_NOT_SET) return "null";

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(meta, &json);
  if (!status.ok()) {
    throw util::ValidationError("meta is not representable as JSON: " + std::string(status.message()));
  }
  if (json.empty()) throw util::ValidationError("meta is not representable as JSON");
  return json;
}

google::protobuf::Value DecodeMeta(const std::string& json) {
  google::protobuf::Value meta;
  if (json.empty()) {
    meta.set_null_value(google::protobuf::NULL_VALUE);
    return meta;
  }
  const auto status = google::protobuf::util::JsonStringToMessage(json, &meta);
  if (!status.ok()) {
    throw std::runtime_error("decode stored meta: " + std::string(status.message()));
  }
  return meta;
}

heartbeat::v1::HealthState ToProto(model::HealthState state) {
  switch (state) {
    case model::HealthState::kOk:
      return heartbeat::v1::HEALTH_STATE_OK;
    case model::HealthState::kWarn:
      return heartbeat::v1::HEALTH_STATE_WARN;
    case model::HealthState::kDown:
      return heartbeat::v1::HEALTH_STATE_DOWN;
    case model::HealthState::kUnknown:
    default:
      return heartbeat::v1::HEALTH_STATE_UNKNOWN;
  }
}

heartbeat::v1::Tier ToProto(model::Tier tier) {
  return tier == model::Tier::kPremium ? heartbeat::v1::TIER_PREMIUM : heartbeat::v1::TIER_FREE;
}

heartbeat::v1::ClientRecord ToProto(const db::model::ClientRecord& record) {
  heartbeat::v1::ClientRecord out;
  out.set_id(record.id);
  out.set_last_seen_ms(record.last_seen_ms);
  if (record.source_ip) out.set_source_ip(*record.source_ip);
  if (record.user_agent) out.set_user_agent(*record.user_agent);
  if (record.meta_json) *out.mutable_meta() = DecodeMeta(*record.meta_json);
  out.set_verified(record.verified);
  return out;
}

heartbeat::v1::TenantConfig ToProto(const db::model::TenantConfigRecord& config) {
  heartbeat::v1::TenantConfig out;
  out.set_tier(ToProto(model::ParseTier(config.tier)));
  if (config.alert_webhook_url) out.set_alert_webhook_url(*config.alert_webhook_url);
  out.set_updated_at_ms(config.updated_at_ms);
  return out;
}

heartbeat::v1::Fact ToProto(const db::model::FactRecord& fact) {
  heartbeat::v1::Fact out;
  out.set_ts_ms(fact.ts_ms);
  out.set_source(fact.source);
  out.set_type(fact.type);
  out.set_entity(fact.entity);
  if (fact.meta_json) *out.mutable_meta() = DecodeMeta(*fact.meta_json);
  return out;
}

} // namespace heartbeat::core
