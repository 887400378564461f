#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

using offsync::runtime::Server;

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
    std::cerr << "Usage: offsyncd <config.yaml> OR offsyncd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = offsync::config::ConfigLoader::LoadFromYaml(config_path);

    offsync::observability::InitializeLogging(config);
    offsync::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = offsync::factory::Build(config);

    // ------------------------------------------------------------
    // Start control server
    // ------------------------------------------------------------
    Server server(config.control().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    OFFSYNC_LOG_INFO("offsyncd started", {offsync::observability::StringField("bind_address", config.control().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    OFFSYNC_LOG_INFO("Shutting down offsyncd");

    server.Stop();
    app.Stop();
    offsync::observability::ShutdownMetrics();
    offsync::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    OFFSYNC_LOG_ERROR("Fatal error", {offsync::observability::StringField("error", e.what())});
    offsync::observability::ShutdownMetrics();
    offsync::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
