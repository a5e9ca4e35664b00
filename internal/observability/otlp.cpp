#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace heartbeat::observability {

OtlpConfig ToOtlpConfig(const heartbeat::runtime::config::ObservabilityConfig& observability) {
  OtlpConfig config;
  config.endpoint  = observability.otlp_endpoint();
  config.transport = observability.transport() == heartbeat::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_interval_ms() > 0) {
    config.export_interval_ms = observability.metrics_interval_ms();
  }
  return config;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, const char* http_path) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  for (const char* name : {signal_env, "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
      return value;
    }
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return std::string("http://localhost:4318") + http_path;
  }
  return "localhost:4317";
}

} // namespace heartbeat::observability
