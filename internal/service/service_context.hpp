#pragma once

#include <memory>
#include <string>

namespace heartbeat::core { class HeartbeatEngine; }
namespace heartbeat::facts { class FactsLog; }

namespace heartbeat::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<heartbeat::core::HeartbeatEngine> engine;
  std::shared_ptr<heartbeat::facts::FactsLog> facts;

  // Serves requests that name no tenant.
  std::string default_tenant = "public";

  // Required by AdminService.SetConfig; empty disables config writes.
  std::string admin_token;
};

// Blank request tenants resolve to the default tenant. Clients that sign
// pings resolve the same way so the signed tenant matches the served one.
std::string ResolveTenant(const std::string& requested, const std::string& default_tenant);
std::string ResolveTenant(const ServiceContext& ctx, const std::string& requested);

}
