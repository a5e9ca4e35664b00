#pragma once

#include <memory>
#include <string_view>

namespace heartbeat::runtime::config {
class RuntimeConfig;
}

namespace heartbeat::observability {

bool InitializeMetrics(const heartbeat::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments. Without HEARTBEAT_ENABLE_OTEL every call is
  an inline no-op.

    heartbeat.request.count / latency_ms   per RPC route
    heartbeat.ping.count                   verified=true|false
    heartbeat.state.transitions            from, to
    heartbeat.alert.deliveries             success=true|false
    heartbeat.alert.dropped                reason
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordPing(bool verified);
  void RecordStateTransition(std::string_view from, std::string_view to);
  void RecordAlertDelivery(bool success);
  void RecordAlertDropped(std::string_view reason);

 private:
  Metrics();
#ifdef HEARTBEAT_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef HEARTBEAT_ENABLE_OTEL
inline bool InitializeMetrics(const heartbeat::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordPing(bool) {
}

inline void Metrics::RecordStateTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordAlertDelivery(bool) {
}

inline void Metrics::RecordAlertDropped(std::string_view) {
}
#endif

} // namespace heartbeat::observability
