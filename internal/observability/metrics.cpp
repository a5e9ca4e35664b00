#include "internal/observability/metrics.hpp"

#ifdef HEARTBEAT_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace heartbeat::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// AttributeValue keeps a view; the caller's string must outlive the call
opentelemetry::nostd::string_view AttrText(std::string_view value) {
  return {value.data(), value.size()};
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

using Counter = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;

void Count(const Counter& counter, std::initializer_list<AttributePair> attributes) {
  if (counter) {
    AddWithAttributes(counter, static_cast<std::uint64_t>(1), attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter>             meter;
  Counter                                                          request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>> request_latency_ms;
  Counter                                                          ping_count;
  Counter                                                          transition_count;
  Counter                                                          alert_delivery_count;
  Counter                                                          alert_dropped_count;
};

bool InitializeMetrics(const heartbeat::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config.observability());

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(otlp_config), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", otlp_config.service_name}}));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is global at first use, so
// InitializeMetrics must run before the first request.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto& m = *impl_;
  m.meter = metrics_api::Provider::GetMeterProvider()->GetMeter("heartbeat-monitor", "0.1.0");

  m.request_count        = m.meter->CreateUInt64Counter("heartbeat.request.count", "Service requests", "1");
  m.request_latency_ms   = m.meter->CreateDoubleHistogram("heartbeat.request.latency_ms", "Service request latency", "ms");
  m.ping_count           = m.meter->CreateUInt64Counter("heartbeat.ping.count", "Accepted pings", "1");
  m.transition_count     = m.meter->CreateUInt64Counter("heartbeat.state.transitions", "Observed client state transitions", "1");
  m.alert_delivery_count = m.meter->CreateUInt64Counter("heartbeat.alert.deliveries", "Webhook delivery attempts", "1");
  m.alert_dropped_count  = m.meter->CreateUInt64Counter("heartbeat.alert.dropped", "Alerts dropped before delivery", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Count(impl_->request_count, {{"route", AttrText(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (impl_->request_latency_ms) {
    const std::initializer_list<AttributePair> attributes = {{"route", AttrText(route)}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
  }
}

void Metrics::RecordPing(bool verified) {
  Count(impl_->ping_count, {{"verified", verified}});
}

void Metrics::RecordStateTransition(std::string_view from, std::string_view to) {
  Count(impl_->transition_count, {{"from", AttrText(from)}, {"to", AttrText(to)}});
}

void Metrics::RecordAlertDelivery(bool success) {
  Count(impl_->alert_delivery_count, {{"success", success}});
}

void Metrics::RecordAlertDropped(std::string_view reason) {
  Count(impl_->alert_dropped_count, {{"reason", AttrText(reason)}});
}

} // namespace heartbeat::observability

#endif
