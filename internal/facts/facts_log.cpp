#include "internal/facts/facts_log.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/core/proto_mapping.hpp"
#include "internal/tenant/tenant_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace heartbeat::facts {

namespace {

std::string RequireField(const std::string& value, const char* name) {
  auto trimmed = util::Trim(value);
  if (trimmed.empty()) {
    throw util::MissingFieldError(std::string("missing ") + name);
  }
  return trimmed;
}

std::shared_ptr<tenant::TenantContext> Acquire(tenant::TenantRegistry& registry, const std::string& tenant) {
  if (util::IsBlank(tenant)) {
    throw util::MissingFieldError("missing tenant");
  }
  return registry.Acquire(tenant);
}

} // namespace

FactsLog::FactsLog(std::shared_ptr<tenant::TenantRegistry> registry, std::shared_ptr<const util::Clock> clock)
    : registry_(std::move(registry)), clock_(std::move(clock)) {
  if (!registry_ || !clock_) {
    throw std::invalid_argument("facts log requires registry and clock");
  }
}

heartbeat::v1::Fact FactsLog::RecordFact(const std::string&                            tenant,
                                         const std::string&                            source,
                                         const std::string&                            type,
                                         const std::string&                            entity,
                                         const std::optional<google::protobuf::Value>& meta) {
  db::model::FactRecord fact;
  fact.source = RequireField(source, "source");
  fact.type   = RequireField(type, "type");
  fact.entity = RequireField(entity, "entity");
  if (meta) {
    fact.meta_json = core::EncodeMeta(*meta);
  }

  auto ctx = Acquire(*registry_, tenant);

  std::lock_guard lock(ctx->mutex);
  fact.ts_ms = clock_->NowMs();
  ctx->store->AppendFact(fact, kMaxFacts);
  return core::ToProto(fact);
}

std::vector<heartbeat::v1::Fact> FactsLog::ListFacts(const std::string& tenant) {
  auto ctx = Acquire(*registry_, tenant);

  std::lock_guard lock(ctx->mutex);

  std::vector<heartbeat::v1::Fact> out;
  for (const auto& fact : ctx->store->ListFacts()) {
    out.push_back(core::ToProto(fact));
  }
  return out;
}

} // namespace heartbeat::facts
