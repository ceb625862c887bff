#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/orchestrator_server.hpp"
#include "internal/hub/hub.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/flow_run_service.hpp"

using forge::runtime::Server;

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
    std::cerr << "Usage: forge-orchestrator <config.yaml> OR forge-orchestrator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = forge::config::ConfigLoader::LoadFromYaml(config_path);

    forge::observability::InitializeTracing(config);
    forge::observability::InitializeMetrics(config);
    forge::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = forge::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<forge::grpc::OrchestratorServer>(app.run_service, app.status_service, app.hub));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FORGE_LOG_INFO("Forge orchestrator started", {forge::observability::StringField("bind_address", config.server().bind_address()),
                                                  forge::observability::StringField("status_directory", config.status().directory())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FORGE_LOG_INFO("Shutting down forge orchestrator");

    // Ends open Subscribe streams before the server drains.
    app.hub->Shutdown();
    server.Stop();
    app.run_service->Stop();

    forge::observability::ShutdownLogging();
    forge::observability::ShutdownMetrics();
    forge::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    FORGE_LOG_ERROR("Fatal error", {forge::observability::StringField("error", e.what())});
    forge::observability::ShutdownLogging();
    forge::observability::ShutdownMetrics();
    forge::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
