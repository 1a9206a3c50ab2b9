#pragma once

#include "mfg/concurrent/thread_safe_queue.hpp"
#include "mfg/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace mfg {

// -----------------------------------------------------------------------------
// IpcServer - dual-socket ZeroMQ gateway for commands and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers JSON command requests (REP socket)
//         and broadcasts JSON telemetry for committed changes (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (ipc.cmd_endpoint):
//      Each request string is handed to the command handler (bound to
//      ManufacturingEngine::executeCommand()) and its JSON reply sent back.
//      ZMQ_RCVTIMEO keeps recv() from blocking longer than kPollTimeoutMs,
//      so the loop alternates between commands and telemetry.
//
//   2. PUB socket (ipc.pub_endpoint):
//      Broadcasts order updates, material issues, production receipts,
//      stock receipts and BOM status changes. Events arrive through a
//      ThreadSafeQueue filled by an EventBus subscriber on whichever thread
//      committed the change; ZMQ sockets are only touched here.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by ManufacturingEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5555",
                     std::string pub_endpoint = "tcp://127.0.0.1:5556");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  // zmq::error_t from bind() propagates (endpoint in use, bad address).
  void start();

  // Joins the worker after it publishes what is still queued. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  // JSON text for a telemetry event, with a "type" discriminator.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace mfg
