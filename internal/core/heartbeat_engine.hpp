#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "heartbeat/v1.hpp"

namespace heartbeat::alert {
class AlertDispatcher;
}
namespace heartbeat::tenant {
class TenantRegistry;
struct TenantContext;
}
namespace heartbeat::util {
class Clock;
}
namespace heartbeat::db::model {
struct TenantConfigRecord;
}

namespace heartbeat::core {

// One ping as received by the transport.
struct PingInput {
  std::string                            id;
  std::optional<std::string>             timestamp;
  std::optional<std::string>             signature;
  std::optional<std::string>             source_ip;
  std::optional<std::string>             user_agent;
  std::optional<google::protobuf::Value> meta;
};

/*
  Heartbeat state engine.

  Every operation runs under the tenant's context mutex for its whole
  read-modify-write sequence. Transition alerts are collected under the
  lock and handed to the dispatcher after it is released; dispatch
  failures never reach the caller.
*/
class HeartbeatEngine {
 public:
  HeartbeatEngine(std::shared_ptr<tenant::TenantRegistry> registry,
                  std::shared_ptr<alert::AlertDispatcher> dispatcher,
                  std::shared_ptr<const util::Clock>      clock,
                  std::string                             signing_secret);

  heartbeat::v1::ClientStatus IngestPing(const std::string& tenant, const PingInput& ping);

  // Throws util::NotFound for an id that never pinged.
  heartbeat::v1::ClientStatus GetStatus(const std::string& tenant, const std::string& id);

  heartbeat::v1::ListClientsResponse ListClients(const std::string& tenant);

  heartbeat::v1::TenantConfig GetConfig(const std::string& tenant);

  // Unknown tier text is stored as free; a blank URL clears the webhook.
  // Throws util::ValidationError for a webhook that is not http(s).
  heartbeat::v1::TenantConfig SetConfig(const std::string& tenant, const std::string& tier, const std::optional<std::string>& alert_webhook_url);

 private:
  struct PendingAlert {
    std::string webhook_url;
    std::string payload_json;
  };

  std::shared_ptr<tenant::TenantContext> Context(const std::string& tenant);

  // Requires ctx.mutex held.
  const db::model::TenantConfigRecord& ConfigLocked(tenant::TenantContext& ctx);

  void DispatchAll(const std::vector<PendingAlert>& alerts);

  std::shared_ptr<tenant::TenantRegistry> registry_;
  std::shared_ptr<alert::AlertDispatcher> dispatcher_;
  std::shared_ptr<const util::Clock>      clock_;
  std::string                             signing_secret_;
};

} // namespace heartbeat::core
