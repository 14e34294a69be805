#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using alo::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  alo::observability::ShutdownLogging();
  alo::observability::ShutdownMetrics();
  alo::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: alo-campaignd <config.yaml> OR alo-campaignd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = alo::config::ConfigLoader::LoadFromYaml(config_path);

    alo::observability::InitializeTracing(config);
    alo::observability::InitializeMetrics(config);
    alo::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = alo::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.StartBackground();
    ALO_LOG_INFO("alo-campaignd started", {alo::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ALO_LOG_INFO("shutting down alo-campaignd");

    server.Stop();
    app.StopBackground();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ALO_LOG_ERROR("fatal error", {alo::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
