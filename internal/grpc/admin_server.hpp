#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "heartbeat/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace heartbeat::grpc {

class AdminServer final : public heartbeat::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<heartbeat::service::AdminService> svc);

  ::grpc::Status GetConfig(::grpc::ServerContext*,
                           const heartbeat::v1::GetConfigRequest*,
                           heartbeat::v1::GetConfigResponse*) override;

  ::grpc::Status SetConfig(::grpc::ServerContext*,
                           const heartbeat::v1::SetConfigRequest*,
                           heartbeat::v1::SetConfigResponse*) override;

private:
  std::shared_ptr<heartbeat::service::AdminService> service_;
};

}
