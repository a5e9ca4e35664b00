#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace heartbeat::runtime {

/*
  Owns the gRPC server and the services registered on it.

  Start() binds and serves on gRPC's own threads; it throws if the
  address cannot be bound. A port of 0 picks a free one, see Port().
  Also serves grpc.health.v1.Health.
*/
class Server {
 public:
  static constexpr std::chrono::milliseconds kDefaultShutdownGrace{5000};

  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::chrono::milliseconds shutdown_grace = kDefaultShutdownGrace);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();

  // In-flight calls get shutdown_grace to finish before being cancelled.
  void Stop();

  int Port() const {
    return port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::chrono::milliseconds                     shutdown_grace_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           port_ = 0;
};

} // namespace heartbeat::runtime
