#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/launchpad_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using launchpad::runtime::Server;

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
    std::cerr << "Usage: launchpad <config.yaml> OR launchpad --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = launchpad::config::ConfigLoader::LoadFromYaml(config_path);

    launchpad::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = launchpad::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<launchpad::grpc::LaunchPadServer>(app.service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50051") : config.server().bind_address();
    Server     server(bind_address, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LAUNCHPAD_LOG_INFO("launchpad started", {launchpad::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LAUNCHPAD_LOG_INFO("Shutting down launchpad");

    server.Stop();
    launchpad::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    LAUNCHPAD_LOG_ERROR("Fatal error", {launchpad::observability::StringField("error", e.what())});
    launchpad::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
