#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace heartbeat::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace heartbeat::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const AuthError*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const ConfigError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (const auto* storage = dynamic_cast<const StorageError*>(&e)) {
    return {storage->retryable() ? ::grpc::StatusCode::UNAVAILABLE : ::grpc::StatusCode::INTERNAL, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace heartbeat::grpc
