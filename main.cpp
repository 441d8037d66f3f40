// -----------------------------------------------------------------------------
// copytrader - single executable entry point.
//
// Paper copy trading of one followed account:
//   1) Load the JSON config (first argument, default config.json).
//   2) Create a LiveTimeProvider (wall clock) and the CopyTradingEngine,
//      then start it. The engine opens the JSON-lines store and the IPC
//      server.
//   3) Create a FillGateway that receives the followed account's fills over
//      ZeroMQ and hands each delivered batch to engine.submitFills().
//   4) Run the gateway's recv loop on the main thread until SIGINT/SIGTERM.
//   5) Stop the engine, which prints the final portfolio summary.
//
// Thread layout:
//   main thread   → FillGateway::run() → filter → PaperTradingSession
//   ipc thread    → IpcServer (REP commands, PUB telemetry)
// -----------------------------------------------------------------------------

#include "copytrader/config/app_config.hpp"
#include "copytrader/engine/copy_trading_engine.hpp"
#include "copytrader/gateway/fill_gateway.hpp"
#include "copytrader/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------------
// Global pointer for signal handler access.
// Points at the stack-local gateway in main(); set once before the handlers
// are installed and cleared after run() returns.
// -----------------------------------------------------------------------------
static copytrader::FillGateway* g_gateway_ptr = nullptr;

// -----------------------------------------------------------------------------
// shutdown_handler
// -----------------------------------------------------------------------------
// @brief  SIGINT/SIGTERM handler. Calls gateway->stop(), an atomic store;
//         run() notices within its 100 ms receive timeout and returns.
// -----------------------------------------------------------------------------
static void shutdown_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration. An explicit path must exist; the default one may be
  // absent, in which case built-in defaults apply.
  // -------------------------------------------------------------------------
  std::string config_path = argc > 1 ? argv[1] : "config.json";

  copytrader::AppConfig config;
  try {
    if (argc > 1 || std::filesystem::exists(config_path)) {
      config = copytrader::loadAppConfig(config_path);
      std::cout << "[main] Loaded config from " << config_path << "\n";
    } else {
      std::cout << "[main] " << config_path
                << " not found, using built-in defaults\n";
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock and engine.
  // -------------------------------------------------------------------------
  copytrader::LiveTimeProvider clock;
  copytrader::CopyTradingEngine engine(config, clock);

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot bind IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Fill gateway. Each delivered message is one batch for the filter.
  // -------------------------------------------------------------------------
  copytrader::FillGateway gateway(
      [&engine](std::vector<copytrader::domain::Fill> batch) {
        engine.submitFills(batch);
      },
      config.feed.endpoint);

  // -------------------------------------------------------------------------
  // 4) Signal handlers, then block in the recv loop.
  // -------------------------------------------------------------------------
  g_gateway_ptr = &gateway;
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] FillGateway listening on " << config.feed.endpoint
            << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  gateway.run();

  g_gateway_ptr = nullptr;

  // -------------------------------------------------------------------------
  // 5) Clean shutdown.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] Gateway exited. Stopping engine...\n";
  engine.stop();

  return 0;
}
