#include "server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace heartbeat::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, std::chrono::milliseconds shutdown_grace)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), shutdown_grace_(shutdown_grace) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    throw std::logic_error("gRPC server already started on " + bind_address_);
  }

  ::grpc::EnableDefaultHealthCheckService(true);

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    port_ = 0;
    throw std::runtime_error("failed to bind gRPC server on " + bind_address_);
  }

  HEARTBEAT_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_), observability::IntField("port", port_),
                                               observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) {
    grpc_server_->Wait();
  }
}

void Server::Stop() {
  if (!grpc_server_) return;

  grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
  grpc_server_.reset();
  port_ = 0;
  HEARTBEAT_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", bind_address_)});
}

} // namespace heartbeat::runtime
