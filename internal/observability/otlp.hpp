#pragma once

#include <cstdint>
#include <string>

namespace heartbeat::runtime::config {
class ObservabilityConfig;
}

namespace heartbeat::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"heartbeat-monitor"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

OtlpConfig ToOtlpConfig(const heartbeat::runtime::config::ObservabilityConfig& observability);

/*
  Endpoint precedence: config, then the signal's own env var
  (OTEL_EXPORTER_OTLP_TRACES_ENDPOINT / ..._METRICS_ENDPOINT), then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
*/
std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, const char* http_path);

} // namespace heartbeat::observability
