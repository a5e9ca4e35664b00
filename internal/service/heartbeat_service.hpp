#pragma once

#include <optional>
#include <string>

#include "heartbeat/v1.hpp"
#include "service_context.hpp"

namespace heartbeat::service {

// Caller details the transport knows and the request body does not.
struct RequestInfo {
  std::optional<std::string> source_ip;
  std::optional<std::string> user_agent;
};

class HeartbeatService {
public:
  explicit HeartbeatService(ServiceContext ctx);

  heartbeat::v1::PingResponse
  Ping(const heartbeat::v1::PingRequest& req, const RequestInfo& info);

  heartbeat::v1::GetStatusResponse
  GetStatus(const heartbeat::v1::GetStatusRequest& req);

  heartbeat::v1::ListClientsResponse
  ListClients(const heartbeat::v1::ListClientsRequest& req);

private:
  ServiceContext ctx_;
};

}
