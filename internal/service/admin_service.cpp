#include "admin_service.hpp"

#include "internal/core/heartbeat_engine.hpp"
#include "internal/security/admin_token.hpp"
#include "rpc_observer.hpp"

namespace heartbeat::service {

using namespace heartbeat::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetConfigResponse AdminService::GetConfig(const GetConfigRequest& req) {
  const auto tenant = ResolveTenant(ctx_, req.tenant());
  return ObserveRpc("AdminService.GetConfig", tenant, [&] {
    GetConfigResponse resp;
    *resp.mutable_config() = ctx_.engine->GetConfig(tenant);
    return resp;
  });
}

SetConfigResponse AdminService::SetConfig(const SetConfigRequest& req, const std::optional<std::string>& admin_token) {
  const auto tenant = ResolveTenant(ctx_, req.tenant());
  return ObserveRpc("AdminService.SetConfig", tenant, [&] {
    heartbeat::security::RequireAdminToken(ctx_.admin_token, admin_token);

    std::optional<std::string> webhook;
    if (req.has_alert_webhook_url()) webhook = req.alert_webhook_url();

    SetConfigResponse resp;
    *resp.mutable_config() = ctx_.engine->SetConfig(tenant, req.tier(), webhook);
    return resp;
  });
}

} // namespace heartbeat::service
