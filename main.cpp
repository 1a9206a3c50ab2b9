// -----------------------------------------------------------------------------
// mfg_engine - single executable entry point.
//
//   mfg_engine <config.json> [seed.json]
//
//   1) Load EngineConfig from argv[1] (ConfigLoader, nlohmann/json).
//   2) Create the ManufacturingEngine on the live clock.
//   3) Load master data, BOMs and opening stock from argv[2], if given.
//   4) Subscribe logging callbacks for every committed change.
//   5) Start the engine: the IpcServer thread answers JSON commands on the
//      REP endpoint and broadcasts telemetry on the PUB endpoint.
//   6) Idle on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread   -> waits for SIGINT
//   ipc thread    -> IpcServer loop; every command runs here
//
// Exit codes: 0 clean shutdown, 1 bad usage / configuration / seed data,
// 2 IPC endpoints could not be bound.
// -----------------------------------------------------------------------------

#include "mfg/config/config_loader.hpp"
#include "mfg/engine/manufacturing_engine.hpp"
#include "mfg/errors/errors.hpp"
#include "mfg/events/event.hpp"
#include "mfg/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// The only global: a lock-free flag the SIGINT handler flips. main() polls it.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: " << argv[0] << " <config.json> [seed.json]\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  mfg::domain::EngineConfig config;
  try {
    config = mfg::ConfigLoader::load(argv[1]);
  } catch (const mfg::EngineError& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine on the wall clock.
  // -------------------------------------------------------------------------
  mfg::LiveTimeProvider clock;
  mfg::ManufacturingEngine engine(config, clock);

  // -------------------------------------------------------------------------
  // 3) Optional seed data.
  // -------------------------------------------------------------------------
  if (argc == 3) {
    try {
      engine.loadSeedFile(argv[2]);
    } catch (const mfg::EngineError& e) {
      std::cerr << "[main] Seed data rejected: " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 4) Logging callbacks. They run on the thread that committed the change.
  // -------------------------------------------------------------------------
  engine.eventBus().subscribe<mfg::OrderUpdateEvent>(
      [](const mfg::OrderUpdateEvent& e) {
        std::cout << "[OrderUpdate] " << e.order.order_no << " "
                  << (e.previous_status
                          ? mfg::domain::toString(*e.previous_status)
                          : "NEW")
                  << " -> " << mfg::domain::toString(e.order.status)
                  << " seq=" << e.sequence_id << "\n";
      });

  engine.eventBus().subscribe<mfg::StockReceivedEvent>(
      [](const mfg::StockReceivedEvent& e) {
        std::cout << "[StockReceived] lot=" << e.lot.id
                  << " product=" << e.lot.product_id
                  << " batch=" << e.lot.batch_no << " qty=" << e.lot.quantity
                  << " seq=" << e.sequence_id << "\n";
      });

  // -------------------------------------------------------------------------
  // 5) Start IPC.
  // -------------------------------------------------------------------------
  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot start IPC server: " << e.what() << "\n";
    return 2;
  }

  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  std::cout << "[main] Commands on " << config.ipc_cmd_endpoint
            << ", telemetry on " << config.ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 6) Wait for Ctrl-C, then stop (joins the IPC thread).
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
