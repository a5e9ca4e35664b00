#include "heartbeat_service.hpp"

#include "internal/core/heartbeat_engine.hpp"
#include "rpc_observer.hpp"

namespace heartbeat::service {

using namespace heartbeat::v1;

HeartbeatService::HeartbeatService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PingResponse HeartbeatService::Ping(const PingRequest& req, const RequestInfo& info) {
  const auto tenant = ResolveTenant(ctx_, req.tenant());
  return ObserveRpc("HeartbeatService.Ping", tenant, [&] {
    core::PingInput ping;
    ping.id = req.id();
    if (req.has_timestamp()) ping.timestamp = req.timestamp();
    if (req.has_signature()) ping.signature = req.signature();
    if (req.has_meta()) ping.meta = req.meta();
    ping.source_ip  = info.source_ip;
    ping.user_agent = info.user_agent;

    PingResponse resp;
    *resp.mutable_status() = ctx_.engine->IngestPing(tenant, ping);
    return resp;
  });
}

GetStatusResponse HeartbeatService::GetStatus(const GetStatusRequest& req) {
  const auto tenant = ResolveTenant(ctx_, req.tenant());
  return ObserveRpc("HeartbeatService.GetStatus", tenant, [&] {
    GetStatusResponse resp;
    *resp.mutable_status() = ctx_.engine->GetStatus(tenant, req.id());
    return resp;
  });
}

ListClientsResponse HeartbeatService::ListClients(const ListClientsRequest& req) {
  const auto tenant = ResolveTenant(ctx_, req.tenant());
  return ObserveRpc("HeartbeatService.ListClients", tenant, [&] { return ctx_.engine->ListClients(tenant); });
}

} // namespace heartbeat::service
