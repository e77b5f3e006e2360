#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/session_manager.hpp"
#include "internal/factory.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recovery/recovery_coordinator.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using sessionkeeper::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: sessionkeeper <config.yaml> OR sessionkeeper --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sessionkeeper::config::ConfigLoader::LoadFromYaml(config_path);

    sessionkeeper::observability::InitializeTracing(config);
    sessionkeeper::observability::InitializeMetrics(config);
    sessionkeeper::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = sessionkeeper::factory::Build(config);

    // ------------------------------------------------------------
    // Startup recovery
    // ------------------------------------------------------------
    // Runs before the server accepts traffic. A store outage here is
    // not fatal; the periodic pass retries.
    try {
      app.coordinator->RepairStaleResuming();
      app.coordinator->RunOnce();
    } catch (const sessionkeeper::util::StoreUnavailable& e) {
      SESSIONKEEPER_LOG_WARN("startup recovery skipped", {sessionkeeper::observability::StringField("error", e.what())});
    }

    app.monitor->Start();
    app.coordinator->Start();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(app.options.bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SESSIONKEEPER_LOG_INFO("sessionkeeper started", {sessionkeeper::observability::StringField("bind_address", app.options.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SESSIONKEEPER_LOG_INFO("shutting down sessionkeeper",
                           {sessionkeeper::observability::IntField("live_sessions", static_cast<std::int64_t>(app.manager->LiveCount()))});

    // Live sessions stay ACTIVE in the store; the next process recovers them.
    server.Stop();
    app.coordinator->Stop();
    app.monitor->Stop();

    sessionkeeper::observability::ShutdownLogging();
    sessionkeeper::observability::ShutdownMetrics();
    sessionkeeper::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SESSIONKEEPER_LOG_ERROR("Fatal error", {sessionkeeper::observability::StringField("error", e.what())});
    sessionkeeper::observability::ShutdownLogging();
    sessionkeeper::observability::ShutdownMetrics();
    sessionkeeper::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
