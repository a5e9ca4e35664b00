#include <curl/curl.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/alert/alert_worker.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/runtime/server.hpp"

using heartbeat::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  heartbeat::observability::ShutdownLogging();
  heartbeat::observability::ShutdownMetrics();
  heartbeat::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: heartbeat-server <config.yaml> OR heartbeat-server --config <config.yaml>" << std::endl;
    return 1;
  }

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "curl_global_init failed" << std::endl;
    return 2;
  }

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = heartbeat::config::ConfigLoader::LoadFromYaml(config_path);

    heartbeat::observability::InitializeTracing(config);
    heartbeat::observability::InitializeMetrics(config);
    heartbeat::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = heartbeat::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    HEARTBEAT_LOG_INFO("Heartbeat server started", {heartbeat::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    HEARTBEAT_LOG_INFO("Shutting down heartbeat server");

    server.Stop();
    app.alert_worker->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    HEARTBEAT_LOG_ERROR("Fatal error", {heartbeat::observability::StringField("error", e.what())});
    ShutdownObservability();
    exit_code = 2;
  }

  curl_global_cleanup();
  return exit_code;
}
