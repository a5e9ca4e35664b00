#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "heartbeat/v1/heartbeat_service.grpc.pb.h"
#include "internal/service/heartbeat_service.hpp"

namespace heartbeat::grpc {

class HeartbeatServer final : public heartbeat::v1::HeartbeatService::Service {
public:
  explicit HeartbeatServer(std::shared_ptr<heartbeat::service::HeartbeatService> svc);

  ::grpc::Status Ping(::grpc::ServerContext*,
                      const heartbeat::v1::PingRequest*,
                      heartbeat::v1::PingResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*,
                           const heartbeat::v1::GetStatusRequest*,
                           heartbeat::v1::GetStatusResponse*) override;

  ::grpc::Status ListClients(::grpc::ServerContext*,
                             const heartbeat::v1::ListClientsRequest*,
                             heartbeat::v1::ListClientsResponse*) override;

private:
  std::shared_ptr<heartbeat::service::HeartbeatService> service_;
};

}
