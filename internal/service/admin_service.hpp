#pragma once

#include <optional>
#include <string>

#include "heartbeat/v1.hpp"
#include "service_context.hpp"

namespace heartbeat::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  heartbeat::v1::GetConfigResponse
  GetConfig(const heartbeat::v1::GetConfigRequest& req);

  // admin_token is the token presented by the caller, if any.
  heartbeat::v1::SetConfigResponse
  SetConfig(const heartbeat::v1::SetConfigRequest& req, const std::optional<std::string>& admin_token);

private:
  ServiceContext ctx_;
};

}
