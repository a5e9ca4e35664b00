#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "heartbeat/v1/facts_service.grpc.pb.h"
#include "internal/service/facts_service.hpp"

namespace heartbeat::grpc {

class FactsServer final : public heartbeat::v1::FactsService::Service {
public:
  explicit FactsServer(std::shared_ptr<heartbeat::service::FactsService> svc);

  ::grpc::Status RecordFact(::grpc::ServerContext*,
                            const heartbeat::v1::RecordFactRequest*,
                            heartbeat::v1::RecordFactResponse*) override;

  ::grpc::Status ListFacts(::grpc::ServerContext*,
                           const heartbeat::v1::ListFactsRequest*,
                           heartbeat::v1::ListFactsResponse*) override;

private:
  std::shared_ptr<heartbeat::service::FactsService> service_;
};

}
