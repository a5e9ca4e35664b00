#include "facts_service.hpp"

#include "internal/facts/facts_log.hpp"
#include "rpc_observer.hpp"

namespace heartbeat::service {

using namespace heartbeat::v1;

FactsService::FactsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RecordFactResponse FactsService::RecordFact(const RecordFactRequest& req) {
  const auto tenant = ResolveTenant(ctx_, req.tenant());
  return ObserveRpc("FactsService.RecordFact", tenant, [&] {
    std::optional<google::protobuf::Value> meta;
    if (req.has_meta()) meta = req.meta();

    RecordFactResponse resp;
    *resp.mutable_fact() = ctx_.facts->RecordFact(tenant, req.source(), req.type(), req.entity(), meta);
    return resp;
  });
}

ListFactsResponse FactsService::ListFacts(const ListFactsRequest& req) {
  const auto tenant = ResolveTenant(ctx_, req.tenant());
  return ObserveRpc("FactsService.ListFacts", tenant, [&] {
    ListFactsResponse resp;
    for (auto& fact : ctx_.facts->ListFacts(tenant)) {
      *resp.add_facts() = std::move(fact);
    }
    return resp;
  });
}

} // namespace heartbeat::service
