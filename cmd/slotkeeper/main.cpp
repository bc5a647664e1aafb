#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/booking_server.hpp"
#include "internal/grpc/conversation_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using slotkeeper::factory::Build;
using slotkeeper::runtime::Server;

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
    std::cerr << "Usage: slotkeeper <config.yaml> OR slotkeeper --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = slotkeeper::config::ConfigLoader::LoadFromYaml(config_path);

    slotkeeper::observability::InitializeTracing(config);
    slotkeeper::observability::InitializeMetrics(config);
    slotkeeper::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<slotkeeper::grpc::ConversationServer>(app.conversation_service));
    services.push_back(std::make_unique<slotkeeper::grpc::BookingServer>(app.booking_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    SLOTKEEPER_LOG_INFO("Slotkeeper started", {slotkeeper::observability::StringField("bind_address", config.server().bind_address()),
                                               slotkeeper::observability::IntField("projects", static_cast<int64_t>(app.projects->All().size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SLOTKEEPER_LOG_INFO("Shutting down slotkeeper");

    server.Stop();
    app.Stop();
    slotkeeper::observability::ShutdownLogging();
    slotkeeper::observability::ShutdownMetrics();
    slotkeeper::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SLOTKEEPER_LOG_ERROR("Fatal error", {slotkeeper::observability::StringField("error", e.what())});
    slotkeeper::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
