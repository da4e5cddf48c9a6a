#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using streamctl::factory::Build;
using streamctl::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: streamctld [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration (defaults, file, environment)
    // ------------------------------------------------------------
    auto config = streamctl::config::ConfigLoader::Load(config_path);

    streamctl::observability::InitializeTracing(config);
    streamctl::observability::InitializeMetrics(config);
    streamctl::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    STREAMCTL_LOG_INFO("streamctld started", {streamctl::observability::StringField("bind_address", config.server().bind_address()),
                                              streamctl::observability::StringField("base_dir", config.supervisor().base_dir()),
                                              streamctl::observability::StringField("transcoder", config.supervisor().transcoder_bin())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // Managed streams keep running; the next start adopts them.
    STREAMCTL_LOG_INFO("Shutting down streamctld");

    server.Stop();
    app.reaper->Stop();
    streamctl::observability::ShutdownLogging();
    streamctl::observability::ShutdownMetrics();
    streamctl::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    STREAMCTL_LOG_ERROR("Fatal error", {streamctl::observability::StringField("error", e.what())});
    streamctl::observability::ShutdownLogging();
    streamctl::observability::ShutdownMetrics();
    streamctl::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
