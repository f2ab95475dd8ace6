#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/escrow_manager.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using escrow::runtime::Server;

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
    std::cerr << "Usage: escrow-ledger <config.yaml> OR escrow-ledger --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = escrow::config::ConfigLoader::LoadFromYaml(config_path);

    escrow::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = escrow::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address =
        config.server().bind_address().empty() ? std::string(escrow::factory::kDefaultBindAddress) : config.server().bind_address();
    const auto grace_ms = config.server().shutdown_grace_ms() == 0 ? 5000u : config.server().shutdown_grace_ms();
    Server     server(bind_address, std::move(app.grpc_services), std::chrono::milliseconds(grace_ms));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    const auto fee   = app.manager->GetFeePolicy();
    const auto stats = app.manager->Stats();
    ESCROW_LOG_INFO("Escrow ledger started",
                    {escrow::observability::StringField("backend", config.database().has_sqlite() ? "sqlite" : "memory"),
                     escrow::observability::IntField("port", server.BoundPort()),
                     escrow::observability::UintField("platform_fee_bps", fee.platform_fee_bps()),
                     escrow::observability::StringField("fee_recipient", fee.fee_recipient()),
                     escrow::observability::UintField("task_counter", stats.task_counter),
                     escrow::observability::UintField("value_locked", stats.value_locked)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ESCROW_LOG_INFO("Shutting down escrow ledger");

    server.Stop();
    escrow::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ESCROW_LOG_ERROR("Fatal error", {escrow::observability::StringField("error", e.what())});
    escrow::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
