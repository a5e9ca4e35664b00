#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "request_info.hpp"

namespace heartbeat::grpc {

AdminServer::AdminServer(std::shared_ptr<heartbeat::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetConfig(::grpc::ServerContext*, const heartbeat::v1::GetConfigRequest* req, heartbeat::v1::GetConfigResponse* resp) {
  try {
    *resp = service_->GetConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SetConfig(::grpc::ServerContext* ctx, const heartbeat::v1::SetConfigRequest* req, heartbeat::v1::SetConfigResponse* resp) {
  try {
    *resp = service_->SetConfig(*req, ExtractAdminToken(*ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace heartbeat::grpc
