#include "internal/core/heartbeat_engine.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "internal/alert/alert_dispatcher.hpp"
#include "internal/alert/alert_payload.hpp"
#include "internal/core/proto_mapping.hpp"
#include "internal/model/health_state.hpp"
#include "internal/model/tier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/security/signature_verifier.hpp"
#include "internal/tenant/tenant_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace heartbeat::core {

using namespace heartbeat::v1;

namespace {

bool AlertsEnabled(const db::model::TenantConfigRecord& config) {
  return model::ParseTier(config.tier) == model::Tier::kPremium && config.alert_webhook_url.has_value();
}

int64_t AgeMs(int64_t now_ms, int64_t last_seen_ms) {
  // writer and reader clocks may disagree
  return std::max<int64_t>(0, now_ms - last_seen_ms);
}

std::string RequireId(const std::string& raw) {
  auto id = util::Trim(raw);
  if (id.empty()) {
    throw util::MissingIdError();
  }
  return id;
}

} // namespace

HeartbeatEngine::HeartbeatEngine(std::shared_ptr<tenant::TenantRegistry> registry,
                                 std::shared_ptr<alert::AlertDispatcher> dispatcher,
                                 std::shared_ptr<const util::Clock>      clock,
                                 std::string                             signing_secret)
    : registry_(std::move(registry)), dispatcher_(std::move(dispatcher)), clock_(std::move(clock)), signing_secret_(std::move(signing_secret)) {
  if (!registry_ || !dispatcher_ || !clock_) {
    throw std::invalid_argument("heartbeat engine requires registry, dispatcher and clock");
  }
}

std::shared_ptr<tenant::TenantContext> HeartbeatEngine::Context(const std::string& tenant) {
  if (util::IsBlank(tenant)) {
    throw util::MissingFieldError("missing tenant");
  }
  return registry_->Acquire(tenant);
}

const db::model::TenantConfigRecord& HeartbeatEngine::ConfigLocked(tenant::TenantContext& ctx) {
  if (!ctx.config) {
    ctx.config = ctx.store->GetConfig();
  }
  return *ctx.config;
}

void HeartbeatEngine::DispatchAll(const std::vector<PendingAlert>& alerts) {
  for (const auto& pending : alerts) {
    try {
      dispatcher_->Dispatch(pending.webhook_url, pending.payload_json);
    } catch (const std::exception& e) {
      HEARTBEAT_LOG_WARN("alert dispatch failed", {observability::StringField("webhook_url", pending.webhook_url), observability::StringField("error", e.what())});
    }
  }
}

ClientStatus HeartbeatEngine::IngestPing(const std::string& tenant, const PingInput& ping) {
  const auto id  = RequireId(ping.id);
  auto       ctx = Context(tenant);

  ClientStatus              status;
  std::vector<PendingAlert> alerts;
  {
    std::lock_guard lock(ctx->mutex);

    const auto config  = ConfigLocked(*ctx);
    const auto tier    = model::ParseTier(config.tier);
    const auto now_ms  = clock_->NowMs();
    const bool has_ts  = ping.timestamp.has_value();
    const bool has_sig = ping.signature.has_value();

    bool verified = false;
    if (tier == model::Tier::kPremium) {
      if (!has_ts || !has_sig) {
        throw util::UnauthorizedError("premium requires timestamp and signature");
      }
      security::Verify(signing_secret_, ctx->tenant, id, ping.timestamp, ping.signature, now_ms);
      verified = true;
    } else if (has_ts || has_sig) {
      // free tier: a partial or invalid proof still rejects the ping
      security::Verify(signing_secret_, ctx->tenant, id, ping.timestamp, ping.signature, now_ms);
      verified = true;
    }

    db::model::ClientRecord record;
    record.id           = id;
    record.last_seen_ms = now_ms;
    record.source_ip    = ping.source_ip;
    record.user_agent   = ping.user_agent;
    if (ping.meta) {
      record.meta_json = EncodeMeta(*ping.meta);
    }
    record.verified = verified;
    ctx->store->PutRecord(record);

    const auto prior = ctx->store->GetLastState(id);
    if (prior && *prior != model::HealthState::kOk) {
      observability::Metrics::Instance().RecordStateTransition(model::ToString(*prior), model::ToString(model::HealthState::kOk));
      if (AlertsEnabled(config)) {
        alerts.push_back({*config.alert_webhook_url,
                          alert::BuildStateChangePayload(ctx->tenant, id, *prior, model::HealthState::kOk, 0, now_ms)});
      }
    }
    ctx->store->PutLastState(id, model::HealthState::kOk, now_ms);

    *status.mutable_record() = ToProto(record);
    status.set_state(HEALTH_STATE_OK);
    status.set_age_ms(0);

    observability::Metrics::Instance().RecordPing(verified);
  }

  DispatchAll(alerts);
  return status;
}

ClientStatus HeartbeatEngine::GetStatus(const std::string& tenant, const std::string& raw_id) {
  const auto id  = RequireId(raw_id);
  auto       ctx = Context(tenant);

  std::lock_guard lock(ctx->mutex);

  auto record = ctx->store->GetRecord(id);
  if (!record) {
    throw util::NotFound("client not found: " + id);
  }

  const auto now_ms = clock_->NowMs();
  const auto age_ms = AgeMs(now_ms, record->last_seen_ms);
  const auto state  = model::Classify(age_ms);

  ctx->store->PutLastState(id, state, now_ms);

  ClientStatus status;
  *status.mutable_record() = ToProto(*record);
  status.set_state(ToProto(state));
  status.set_age_ms(age_ms);
  return status;
}

ListClientsResponse HeartbeatEngine::ListClients(const std::string& tenant) {
  auto ctx = Context(tenant);

  ListClientsResponse       response;
  std::vector<PendingAlert> alerts;
  {
    std::lock_guard lock(ctx->mutex);

    const auto config         = ConfigLocked(*ctx);
    const bool alerts_enabled = AlertsEnabled(config);
    const auto now_ms         = clock_->NowMs();

    struct Row {
      db::model::ClientRecord record;
      int64_t                 age_ms;
      model::HealthState      state;
    };

    std::vector<Row> rows;
    for (auto& record : ctx->store->ListRecords()) {
      const auto age_ms = AgeMs(now_ms, record.last_seen_ms);
      rows.push_back({std::move(record), age_ms, model::Classify(age_ms)});
    }
    std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) { return a.age_ms < b.age_ms; });

    for (const auto& row : rows) {
      if (alerts_enabled) {
        const auto prior = ctx->store->GetLastState(row.record.id);
        if (!prior) {
          // first evaluation seeds the state without alerting
          ctx->store->PutLastState(row.record.id, row.state, now_ms);
        } else if (*prior != row.state) {
          ctx->store->PutLastState(row.record.id, row.state, now_ms);
          observability::Metrics::Instance().RecordStateTransition(model::ToString(*prior), model::ToString(row.state));
          alerts.push_back({*config.alert_webhook_url,
                            alert::BuildStateChangePayload(ctx->tenant, row.record.id, *prior, row.state, row.age_ms, now_ms)});
        }
      }

      auto* client              = response.add_clients();
      *client->mutable_record() = ToProto(row.record);
      client->set_state(ToProto(row.state));
      client->set_age_ms(row.age_ms);
    }

    response.set_tier(ToProto(model::ParseTier(config.tier)));
    response.set_now_ms(now_ms);
  }

  DispatchAll(alerts);
  return response;
}

TenantConfig HeartbeatEngine::GetConfig(const std::string& tenant) {
  auto ctx = Context(tenant);

  std::lock_guard lock(ctx->mutex);
  return ToProto(ConfigLocked(*ctx));
}

TenantConfig HeartbeatEngine::SetConfig(const std::string& tenant, const std::string& tier, const std::optional<std::string>& alert_webhook_url) {
  auto ctx = Context(tenant);

  const auto tier_text = util::ToLower(util::Trim(tier));
  if (!model::IsKnownTier(tier_text)) {
    HEARTBEAT_LOG_WARN("unknown tier, storing free", {observability::StringField("tenant", ctx->tenant), observability::StringField("tier", tier)});
  }

  db::model::TenantConfigRecord config;
  config.tenant = ctx->tenant;
  config.tier   = std::string(model::ToString(model::ParseTier(tier_text)));
  if (alert_webhook_url && !util::IsBlank(*alert_webhook_url)) {
    auto url = util::Trim(*alert_webhook_url);
    if (!util::IsHttpUrl(url)) {
      throw util::ValidationError("alert_webhook_url must be an http or https URL");
    }
    config.alert_webhook_url = std::move(url);
  }
  config.updated_at_ms = clock_->NowMs();

  std::lock_guard lock(ctx->mutex);
  ctx->store->PutConfig(config);
  ctx->config = config;

  HEARTBEAT_LOG_INFO("tenant config updated",
                     {observability::StringField("tenant", ctx->tenant), observability::StringField("tier", config.tier),
                      observability::BoolField("webhook", config.alert_webhook_url.has_value())});
  return ToProto(config);
}

} // namespace heartbeat::core
