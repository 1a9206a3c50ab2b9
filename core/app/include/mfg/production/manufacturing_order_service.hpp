#pragma once

#include "mfg/bom/bom_explosion.hpp"
#include "mfg/bom/bom_registry.hpp"
#include "mfg/concurrent/document_number_generator.hpp"
#include "mfg/concurrent/id_generator.hpp"
#include "mfg/domain/engine_config.hpp"
#include "mfg/domain/manufacturing_order.hpp"
#include "mfg/domain/material_issue.hpp"
#include "mfg/domain/production_receipt.hpp"
#include "mfg/eventbus/event_bus.hpp"
#include "mfg/genealogy/genealogy_tracker.hpp"
#include "mfg/inventory/fefo_allocator.hpp"
#include "mfg/inventory/inventory_ledger.hpp"
#include "mfg/master/i_master_data_registry.hpp"
#include "mfg/production/order_repository.hpp"
#include "mfg/time/i_time_provider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mfg {

struct CreateOrderRequest {
  domain::BomId bom_id{};
  double planned_qty{0.0};
  domain::WarehouseId source_warehouse_id{};
  domain::WarehouseId target_warehouse_id{};
  std::optional<CalendarDate> scheduled_date;
  domain::Priority priority{domain::Priority::Normal};
  std::string notes;
};

struct IssuedMaterialLine {
  domain::ProductId material_id{};
  std::string material_name;
  double quantity{0.0};
  std::string uom;
};

struct IssueResult {
  std::string issue_no;
  domain::IssueId issue_id{};
  std::string group_id;
  std::vector<IssuedMaterialLine> materials;
};

struct CompleteOrderRequest {
  domain::OrderId order_id{};
  double produced_qty{0.0};
  std::string batch_no;
  domain::QualityStatus quality_status{domain::QualityStatus::Pending};
  std::string notes;
  // Output expiry for CUTTING / REPACKING. KITTING always inherits.
  std::optional<CalendarDate> expiry;
};

struct CompletionResult {
  std::string receipt_no;
  std::string batch_no;
  double quantity{0.0};
  std::optional<CalendarDate> expiry;
  domain::LotId lot_id{};
};

struct OrderDetail {
  domain::ManufacturingOrder order;
  std::vector<domain::MaterialRequirement> requirements;
  std::vector<domain::MaterialIssue> issues;
  std::vector<domain::IssueDetail> issue_details;
  std::vector<domain::ProductionReceipt> receipts;
};

// An exploded line next to the stock that could cover it.
struct RequirementAvailability {
  RequirementLine line;
  std::string material_name;
  double available{0.0};
  bool sufficient{false};
};

// -----------------------------------------------------------------------------
// ManufacturingOrderService - command handlers of the order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  createOrder / issueMaterials / completeOrder / cancelOrder, each
//         its own transaction boundary, plus the order-side queries.
//
// @details
// Each command follows the same shape:
//   1. runTransaction() with config.max_allocation_retries attempts.
//   2. Inside: read the order, check OrderStateMachine, validate input,
//      build a UnitOfWork, stage every row, commit().
//   3. After a successful commit: publish events, log one line.
//
// Anything thrown before commit() leaves every store untouched. That
// includes InsufficientStockError on the third requirement line after two
// lines were already planned: the whole issuance is one unit of work, so
// an order is never left half-issued.
//
// Cancellation does not reverse consumptions. Cancelling an order that
// already consumed stock is allowed and logged as a warning; the consumed
// lots stay consumed.
//
// Thread model:
//   Every public method may be called concurrently from any thread.
//   Correctness under contention comes from the UnitOfWork version checks.
//
// Ownership:
//   Owned by ManufacturingEngine. All constructor references must outlive
//   the service.
// -----------------------------------------------------------------------------
class ManufacturingOrderService {
 public:
  ManufacturingOrderService(BomRegistry& boms,
                            InventoryLedger& ledger,
                            OrderRepository& orders,
                            GenealogyTracker& genealogy,
                            const FefoAllocator& allocator,
                            DocumentNumberGenerator& numbers,
                            const IMasterDataRegistry& master_data,
                            const ITimeProvider& time_provider,
                            EventBus& bus,
                            IdGenerator& event_sequence,
                            const domain::EngineConfig& config);

  ManufacturingOrderService(const ManufacturingOrderService&) = delete;
  ManufacturingOrderService& operator=(const ManufacturingOrderService&) =
      delete;

  // -------------------------------------------------------------------------
  // createOrder(request, actor)
  // -------------------------------------------------------------------------
  // @brief  Explodes the BOM for planned_qty and persists a CONFIRMED order
  //         with its PENDING requirements.
  //
  // @throws ValidationError  planned_qty <= 0, missing or inactive
  //                          warehouse.
  // @throws NotFoundError    unknown BOM or warehouse, BOM not ACTIVE (when
  //                          require_active_bom), BOM without lines.
  // -------------------------------------------------------------------------
  domain::ManufacturingOrder createOrder(const CreateOrderRequest& request,
                                         const std::string& actor);

  // -------------------------------------------------------------------------
  // issueMaterials(order_id, actor)
  // -------------------------------------------------------------------------
  // @brief  FEFO-allocates every PENDING requirement from the source
  //         warehouse in one unit of work, marks them ISSUED and moves the
  //         order to IN_PROGRESS.
  //
  // @throws NotFoundError                unknown order.
  // @throws InvalidStateTransitionError  order COMPLETED / CANCELLED, or no
  //                                      pending requirement left.
  // @throws InsufficientStockError       some line cannot be covered.
  // @throws ConcurrencyConflictError     retries exhausted.
  // -------------------------------------------------------------------------
  IssueResult issueMaterials(domain::OrderId order_id,
                             const std::string& actor);

  // -------------------------------------------------------------------------
  // completeOrder(request, actor)
  // -------------------------------------------------------------------------
  // @brief  Writes the production receipt and a PRODUCTION_IN lot into the
  //         target warehouse, and completes the order.
  //
  // @details
  // KITTING output inherits the earliest expiry of the consumed lots.
  // CUTTING / REPACKING output takes request.expiry (possibly none).
  //
  // @throws InvalidStateTransitionError  order not IN_PROGRESS.
  // @throws ValidationError              produced_qty outside
  //                                      [0, planned_qty] or empty batch.
  // -------------------------------------------------------------------------
  CompletionResult completeOrder(const CompleteOrderRequest& request,
                                 const std::string& actor);

  // Allowed from CONFIRMED and IN_PROGRESS. Returns the cancelled order.
  domain::ManufacturingOrder cancelOrder(domain::OrderId order_id,
                                         const std::string& actor);

  // Throws NotFoundError for an unknown order.
  OrderDetail orderDetail(domain::OrderId order_id) const;

  std::vector<domain::ManufacturingOrder> listOrders(
      const OrderFilter& filter) const;

  // Throws NotFoundError for an unknown order.
  std::vector<domain::MaterialRequirement> requirements(
      domain::OrderId order_id) const;

  // Explosion + stock check for a prospective order. Persists nothing.
  std::vector<RequirementAvailability> previewRequirements(
      domain::BomId bom_id,
      double planned_qty,
      domain::WarehouseId warehouse_id) const;

 private:
  domain::Warehouse requireWarehouse(domain::WarehouseId id,
                                     const char* role) const;
  CalendarDate today() const;
  void publishOrderUpdate(const domain::ManufacturingOrder& order,
                          std::optional<domain::OrderStatus> previous);

  BomRegistry& boms_;
  InventoryLedger& ledger_;
  OrderRepository& orders_;
  GenealogyTracker& genealogy_;
  const FefoAllocator& allocator_;
  DocumentNumberGenerator& numbers_;
  const IMasterDataRegistry& master_data_;
  const ITimeProvider& time_provider_;
  EventBus& bus_;
  IdGenerator& event_sequence_;
  domain::EngineConfig config_;
};

}  // namespace mfg
