#include "facts_server.hpp"

#include "grpc_error.hpp"

namespace heartbeat::grpc {

FactsServer::FactsServer(std::shared_ptr<heartbeat::service::FactsService> svc) : service_(std::move(svc)) {
}

::grpc::Status FactsServer::RecordFact(::grpc::ServerContext*, const heartbeat::v1::RecordFactRequest* req, heartbeat::v1::RecordFactResponse* resp) {
  try {
    *resp = service_->RecordFact(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FactsServer::ListFacts(::grpc::ServerContext*, const heartbeat::v1::ListFactsRequest* req, heartbeat::v1::ListFactsResponse* resp) {
  try {
    *resp = service_->ListFacts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace heartbeat::grpc
