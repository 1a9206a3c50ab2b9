#include "mfg/network/ipc_server.hpp"
#include "mfg/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace mfg {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain: publish any remaining telemetry before shutdown.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  for (auto& event : telemetry_queue_.drain()) {
    auto json_str = formatTelemetry(event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      // A full HWM drops the message; subscribers are best-effort.
      (void)pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per event, "type" first
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;

  if (auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    j["type"] = "order_update";
    j["order"] = e->order;
    j["previous_status"] =
        e->previous_status
            ? nlohmann::json(domain::toString(*e->previous_status))
            : nlohmann::json(nullptr);
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<MaterialsIssuedEvent>(&event)) {
    j["type"] = "materials_issued";
    j["order_no"] = e->order_no;
    j["issue"] = e->issue;
    j["details"] = e->details;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<ProductionCompletedEvent>(&event)) {
    j["type"] = "production_completed";
    j["order_no"] = e->order_no;
    j["receipt"] = e->receipt;
    j["lot_id"] = e->lot_id;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<StockReceivedEvent>(&event)) {
    j["type"] = "stock_received";
    j["lot"] = e->lot;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<BomStatusChangedEvent>(&event)) {
    j["type"] = "bom_status_changed";
    j["bom_id"] = e->bom_id;
    j["bom_code"] = e->bom_code;
    j["previous_status"] = domain::toString(e->previous_status);
    j["status"] = domain::toString(e->status);
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
  } else {
    return std::nullopt;
  }

  return j.dump();
}

}  // namespace mfg
