#include "heartbeat_server.hpp"

#include "grpc_error.hpp"
#include "request_info.hpp"

namespace heartbeat::grpc {

HeartbeatServer::HeartbeatServer(std::shared_ptr<heartbeat::service::HeartbeatService> svc) : service_(std::move(svc)) {
}

::grpc::Status HeartbeatServer::Ping(::grpc::ServerContext* ctx, const heartbeat::v1::PingRequest* req, heartbeat::v1::PingResponse* resp) {
  try {
    *resp = service_->Ping(*req, ExtractRequestInfo(*ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HeartbeatServer::GetStatus(::grpc::ServerContext*, const heartbeat::v1::GetStatusRequest* req, heartbeat::v1::GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HeartbeatServer::ListClients(::grpc::ServerContext*, const heartbeat::v1::ListClientsRequest* req, heartbeat::v1::ListClientsResponse* resp) {
  try {
    *resp = service_->ListClients(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace heartbeat::grpc
