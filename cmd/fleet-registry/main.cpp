#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/monitor/probe_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using fleet::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  fleet::observability::ShutdownLogging();
  fleet::observability::ShutdownMetrics();
  fleet::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: fleet-registry <config.yaml> OR fleet-registry --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = fleet::config::ConfigLoader::LoadFromYaml(config_path);

    fleet::observability::InitializeLogging(config.logging());
    fleet::observability::InitializeTracing(config.observability());
    fleet::observability::InitializeMetrics(config.observability());

    auto app = fleet::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FLEET_LOG_INFO("fleet registry started", {fleet::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEET_LOG_INFO("shutting down fleet registry");

    server.Stop();
    app.probe_pool->Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Fatal error", {fleet::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
