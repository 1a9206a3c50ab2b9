#pragma once

#include "mfg/bom/bom_registry.hpp"
#include "mfg/concurrent/document_number_generator.hpp"
#include "mfg/concurrent/id_generator.hpp"
#include "mfg/domain/engine_config.hpp"
#include "mfg/eventbus/event_bus.hpp"
#include "mfg/genealogy/genealogy_tracker.hpp"
#include "mfg/inventory/fefo_allocator.hpp"
#include "mfg/inventory/inventory_ledger.hpp"
#include "mfg/master/i_master_data_registry.hpp"
#include "mfg/network/ipc_server.hpp"
#include "mfg/production/manufacturing_order_service.hpp"
#include "mfg/production/order_repository.hpp"
#include "mfg/reporting/production_reports.hpp"
#include "mfg/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace mfg {

// -----------------------------------------------------------------------------
// ManufacturingEngine - top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns every component, wires them together, exposes the JSON
//         command surface and manages the IPC server lifecycle.
//
// @details
// Component graph (constructor order; destruction is the reverse):
//
//   InMemoryMasterDataRegistry    products, warehouses
//   EventBus                      post-commit notifications
//   DocumentNumberGenerator       MO- / MI- / PR- numbers, group ids
//   InventoryLedger               lots and movements
//   OrderRepository               orders, requirements, issues, receipts
//   BomRegistry                   recipes
//   GenealogyTracker              consumed-lot links, batch queries
//   FefoAllocator                 lot selection
//   ManufacturingOrderService     order lifecycle commands
//   ProductionReports             date-ranged aggregates
//
// Everything exists from construction on, so commands and queries work
// without the IPC server; start() only brings the sockets up. The engine
// itself runs no thread: each command executes on the caller's thread (the
// IPC thread, or a test thread).
//
// Command surface:
//   executeCommand() takes a JSON object {"command": "<name>", ...} and
//   returns {"status":"ok", ...} or
//   {"status":"error","error":"<ErrorKind>","message":"..."}. A bare
//   "PING" / "STATUS" string is accepted as well.
//
// Ownership:
//   Holds a reference to the time provider (owned by main() or the test).
//   Owns all components via std::unique_ptr.
// -----------------------------------------------------------------------------
class ManufacturingEngine {
 public:
  ManufacturingEngine(domain::EngineConfig config,
                      const ITimeProvider& time_provider);

  ~ManufacturingEngine();

  ManufacturingEngine(const ManufacturingEngine&) = delete;
  ManufacturingEngine& operator=(const ManufacturingEngine&) = delete;
  ManufacturingEngine(ManufacturingEngine&&) = delete;
  ManufacturingEngine& operator=(ManufacturingEngine&&) = delete;

  // Starts the IPC server unless either endpoint is empty. Idempotent.
  void start();

  // Stops the IPC server. Idempotent; also run by the destructor.
  void stop();

  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // loadSeed(seed) / loadSeedFile(path)
  // -------------------------------------------------------------------------
  // @brief  Loads master data, BOMs and opening stock:
  //         {"products": [...], "warehouses": [...], "boms": [...],
  //          "stock": [...]}. Every section is optional.
  //
  // @throws ValidationError  malformed document or field.
  // @throws any EngineError  raised by the component receiving the row.
  // -------------------------------------------------------------------------
  void loadSeed(const nlohmann::json& seed);
  void loadSeedFile(const std::string& path);

  std::string executeCommand(const std::string& request);

  // Same as executeCommand() on an already-parsed request.
  nlohmann::json handleRequest(const nlohmann::json& request);

  // Commands that publish their own events.
  domain::LedgerEntry receiveStock(const StockReceiptRequest& request,
                                   const std::string& actor);
  domain::BomHeader createBom(const BomDraft& draft, const std::string& actor);
  domain::BomHeader updateBomStatus(domain::BomId bom_id,
                                    domain::BomStatus status,
                                    const std::string& actor);

  InMemoryMasterDataRegistry& masterData() { return *master_data_; }
  EventBus& eventBus() { return *event_bus_; }
  InventoryLedger& ledger() { return *ledger_; }
  OrderRepository& orders() { return *orders_; }
  BomRegistry& boms() { return *boms_; }
  GenealogyTracker& genealogy() { return *genealogy_; }
  const FefoAllocator& allocator() const { return *allocator_; }
  ManufacturingOrderService& orderService() { return *order_service_; }
  const ProductionReports& reports() const { return *reports_; }
  const domain::EngineConfig& config() const { return config_; }

 private:
  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

  void registerHandlers();
  CalendarDate today() const;
  nlohmann::json status() const;

  domain::EngineConfig config_;
  const ITimeProvider& time_provider_;

  IdGenerator event_sequence_;

  std::unique_ptr<InMemoryMasterDataRegistry> master_data_;
  std::unique_ptr<EventBus> event_bus_;
  std::unique_ptr<DocumentNumberGenerator> numbers_;
  std::unique_ptr<InventoryLedger> ledger_;
  std::unique_ptr<OrderRepository> orders_;
  std::unique_ptr<BomRegistry> boms_;
  std::unique_ptr<GenealogyTracker> genealogy_;
  std::unique_ptr<FefoAllocator> allocator_;
  std::unique_ptr<ManufacturingOrderService> order_service_;
  std::unique_ptr<ProductionReports> reports_;

  std::unordered_map<std::string, Handler> handlers_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  bool running_{false};
};

}  // namespace mfg
