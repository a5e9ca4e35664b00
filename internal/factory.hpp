#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace heartbeat::alert {
class AlertWorker;
}

namespace heartbeat::factory {

/*
  Application

  Everything the process needs after Build(): the gRPC services to
  register and the background alert worker, which must be stopped after
  the server so queued alerts drain.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<alert::AlertWorker>          alert_worker;
};

/*
  Build

  Composition root. The only place that knows concrete repository,
  sender and clock types.
*/
Application Build(const heartbeat::runtime::config::RuntimeConfig& config);

} // namespace heartbeat::factory
