#include "mfg/production/manufacturing_order_service.hpp"
#include "mfg/errors/errors.hpp"
#include "mfg/events/materials_issued_event.hpp"
#include "mfg/events/order_update_event.hpp"
#include "mfg/events/production_completed_event.hpp"
#include "mfg/production/order_state_machine.hpp"
#include "mfg/store/unit_of_work.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace mfg {

using domain::kQuantityEpsilon;
using domain::OrderStatus;

ManufacturingOrderService::ManufacturingOrderService(
    BomRegistry& boms,
    InventoryLedger& ledger,
    OrderRepository& orders,
    GenealogyTracker& genealogy,
    const FefoAllocator& allocator,
    DocumentNumberGenerator& numbers,
    const IMasterDataRegistry& master_data,
    const ITimeProvider& time_provider,
    EventBus& bus,
    IdGenerator& event_sequence,
    const domain::EngineConfig& config)
    : boms_(boms),
      ledger_(ledger),
      orders_(orders),
      genealogy_(genealogy),
      allocator_(allocator),
      numbers_(numbers),
      master_data_(master_data),
      time_provider_(time_provider),
      bus_(bus),
      event_sequence_(event_sequence),
      config_(config) {}

// -----------------------------------------------------------------------------
// createOrder(): validate, explode, persist order + requirements
// -----------------------------------------------------------------------------
domain::ManufacturingOrder ManufacturingOrderService::createOrder(
    const CreateOrderRequest& request, const std::string& actor) {
  if (!std::isfinite(request.planned_qty) || request.planned_qty <= 0.0) {
    throw ValidationError("Planned quantity must be positive");
  }
  const domain::Warehouse source =
      requireWarehouse(request.source_warehouse_id, "Source");
  requireWarehouse(request.target_warehouse_id, "Target");

  const domain::BomHeader bom = boms_.get(request.bom_id);
  const auto lines = BomExplosionCalculator::explode(
      bom, request.planned_qty, ExplosionPolicy{config_.require_active_bom});

  auto created = runTransaction(
      config_.max_allocation_retries, "createOrder", [&] {
        const std::int64_t now = time_provider_.now_ms();

        domain::ManufacturingOrder order;
        order.order_no = numbers_.next(config_.order_prefix);
        order.entity_id = source.entity_id;
        order.bom_id = bom.id;
        order.bom_type = bom.type;
        order.product_id = bom.output_product_id;
        order.planned_qty = request.planned_qty;
        order.uom = bom.uom;
        order.source_warehouse_id = request.source_warehouse_id;
        order.target_warehouse_id = request.target_warehouse_id;
        order.status = OrderStatus::Confirmed;
        order.priority = request.priority;
        order.order_date = CalendarDate::fromEpochMs(now);
        order.scheduled_date = request.scheduled_date;
        order.notes = request.notes;
        order.created_by = actor;
        order.updated_by = actor;
        order.created_at_ms = now;
        order.updated_at_ms = now;

        std::vector<domain::MaterialRequirement> requirements;
        requirements.reserve(lines.size());
        for (const auto& line : lines) {
          domain::MaterialRequirement req;
          req.material_id = line.material_id;
          req.material_type = line.material_type;
          req.required_qty = line.required_qty;
          req.issued_qty = 0.0;
          req.uom = line.uom;
          req.warehouse_id = request.source_warehouse_id;
          req.status = domain::RequirementStatus::Pending;
          requirements.push_back(std::move(req));
        }

        UnitOfWork uow(ledger_, orders_, genealogy_);
        order.id = uow.stageNewOrder(order, std::move(requirements));
        uow.commit();
        return order;
      });

  std::cout << "[ManufacturingOrderService] Created " << created.order_no
            << " from " << bom.code << " for " << created.planned_qty << " "
            << created.uom << " (" << lines.size() << " materials)\n";

  publishOrderUpdate(created, std::nullopt);
  return created;
}

// -----------------------------------------------------------------------------
// issueMaterials(): FEFO-allocate every pending line as one unit
// -----------------------------------------------------------------------------
IssueResult ManufacturingOrderService::issueMaterials(
    domain::OrderId order_id, const std::string& actor) {
  struct Outcome {
    IssueResult result;
    domain::ManufacturingOrder order;
    OrderStatus previous_status;
    domain::MaterialIssue issue;
    std::vector<domain::IssueDetail> details;
  };

  Outcome outcome = runTransaction(
      config_.max_allocation_retries,
      "issueMaterials(" + std::to_string(order_id) + ")", [&] {
        domain::ManufacturingOrder order = orders_.getOrder(order_id);
        OrderStateMachine::requireTransition(order, OrderStatus::InProgress,
                                             "issueMaterials");

        std::vector<domain::MaterialRequirement> pending;
        for (auto& req : orders_.requirementsOf(order_id)) {
          if (req.status == domain::RequirementStatus::Pending) {
            pending.push_back(std::move(req));
          }
        }
        if (pending.empty()) {
          throw InvalidStateTransitionError(
              "Order " + order.order_no + " has no pending materials to issue");
        }

        const std::int64_t now = time_provider_.now_ms();
        Outcome out;
        out.previous_status = order.status;

        UnitOfWork uow(ledger_, orders_, genealogy_);

        out.issue.issue_no = numbers_.next(config_.issue_prefix);
        out.issue.order_id = order_id;
        out.issue.warehouse_id = order.source_warehouse_id;
        out.issue.group_id = numbers_.newGroupId();
        out.issue.status = "CONFIRMED";
        out.issue.issued_by = actor;
        out.issue.issued_at_ms = now;
        out.issue.id = uow.stageIssue(out.issue);

        const AllocationContext context{out.issue.group_id,
                                        out.issue.issue_no, actor, now};

        for (auto& req : pending) {
          const double needed = req.required_qty - req.issued_qty;
          const auto takes = allocator_.allocate(
              req.material_id, req.warehouse_id, needed, uow, context);

          for (const auto& take : takes) {
            domain::IssueDetail detail;
            detail.issue_id = out.issue.id;
            detail.order_id = order_id;
            detail.material_id = req.material_id;
            detail.lot_id = take.lot_id;
            detail.batch_no = take.batch_no;
            detail.quantity = take.quantity;
            detail.uom = req.uom;
            uow.stageIssueDetail(detail);
            out.details.push_back(std::move(detail));

            domain::GenealogyLink link;
            link.output_order_id = order_id;
            link.consumed_lot_id = take.lot_id;
            link.material_id = req.material_id;
            link.source_batch_no = take.batch_no;
            link.source_expiry = take.expiry;
            link.quantity = take.quantity;
            link.group_id = out.issue.group_id;
            uow.stageGenealogyLink(std::move(link));
          }

          req.issued_qty = req.required_qty;
          req.status = domain::RequirementStatus::Issued;
          uow.stageRequirementUpdate(req);

          out.result.materials.push_back(IssuedMaterialLine{
              req.material_id, productName(master_data_, req.material_id),
              needed, req.uom});
        }

        order.status = OrderStatus::InProgress;
        order.updated_by = actor;
        order.updated_at_ms = now;
        uow.stageOrderUpdate(order);
        uow.commit();

        out.order = orders_.getOrder(order_id);
        out.result.issue_no = out.issue.issue_no;
        out.result.issue_id = out.issue.id;
        out.result.group_id = out.issue.group_id;
        return out;
      });

  std::cout << "[ManufacturingOrderService] Issued " << outcome.result.issue_no
            << " for order " << outcome.order.order_no << " ("
            << outcome.result.materials.size() << " materials, "
            << outcome.details.size() << " lots)\n";

  if (outcome.previous_status != outcome.order.status) {
    publishOrderUpdate(outcome.order, outcome.previous_status);
  }

  MaterialsIssuedEvent event;
  event.issue = outcome.issue;
  event.order_no = outcome.order.order_no;
  event.details = outcome.details;
  event.timestamp_ms = outcome.issue.issued_at_ms;
  event.sequence_id = event_sequence_.next_id();
  bus_.publish(event);

  return outcome.result;
}

// -----------------------------------------------------------------------------
// completeOrder(): receipt + PRODUCTION_IN lot + COMPLETED
// -----------------------------------------------------------------------------
CompletionResult ManufacturingOrderService::completeOrder(
    const CompleteOrderRequest& request, const std::string& actor) {
  struct Outcome {
    CompletionResult result;
    domain::ManufacturingOrder order;
    OrderStatus previous_status;
    domain::ProductionReceipt receipt;
  };

  Outcome outcome = runTransaction(
      config_.max_allocation_retries,
      "completeOrder(" + std::to_string(request.order_id) + ")", [&] {
        domain::ManufacturingOrder order = orders_.getOrder(request.order_id);
        OrderStateMachine::requireTransition(order, OrderStatus::Completed,
                                             "completeOrder");

        if (!std::isfinite(request.produced_qty) ||
            request.produced_qty < 0.0 ||
            request.produced_qty > order.planned_qty + kQuantityEpsilon) {
          throw ValidationError("Produced quantity must be between 0 and the "
                                "planned quantity of order " +
                                order.order_no);
        }
        if (request.batch_no.empty()) {
          throw ValidationError("Batch number is required");
        }

        std::optional<CalendarDate> expiry;
        if (order.bom_type == domain::BomType::Kitting) {
          expiry = genealogy_.inheritedExpiry(order.id);
          if (request.expiry && request.expiry != expiry) {
            std::cerr << "[ManufacturingOrderService] WARNING: ignoring "
                         "supplied expiry for kitting order "
                      << order.order_no << "; output inherits "
                      << (expiry ? expiry->toString() : "no expiry") << "\n";
          }
        } else {
          expiry = request.expiry;
        }

        const std::int64_t now = time_provider_.now_ms();
        Outcome out;
        out.previous_status = order.status;

        UnitOfWork uow(ledger_, orders_, genealogy_);

        out.receipt.receipt_no = numbers_.next(config_.receipt_prefix);
        out.receipt.order_id = order.id;
        out.receipt.product_id = order.product_id;
        out.receipt.quantity = request.produced_qty;
        out.receipt.uom = order.uom;
        out.receipt.batch_no = request.batch_no;
        out.receipt.warehouse_id = order.target_warehouse_id;
        out.receipt.expiry = expiry;
        out.receipt.quality_status = request.quality_status;
        out.receipt.notes = request.notes;
        out.receipt.group_id = numbers_.newGroupId();
        out.receipt.created_by = actor;
        out.receipt.received_at_ms = now;
        out.receipt.id = uow.stageReceipt(out.receipt);

        domain::LedgerEntry lot;
        lot.movement = domain::MovementType::ProductionIn;
        lot.product_id = order.product_id;
        lot.warehouse_id = order.target_warehouse_id;
        lot.batch_no = request.batch_no;
        lot.quantity = request.produced_qty;
        lot.remain = request.produced_qty;
        lot.uom = order.uom;
        lot.expiry = expiry;
        lot.group_id = out.receipt.group_id;
        lot.source_ref = out.receipt.receipt_no;
        lot.created_by = actor;
        lot.created_at_ms = now;
        out.result.lot_id = uow.stageLedgerEntry(std::move(lot));

        order.status = OrderStatus::Completed;
        order.produced_qty = request.produced_qty;
        order.completion_date = CalendarDate::fromEpochMs(now);
        order.updated_by = actor;
        order.updated_at_ms = now;
        uow.stageOrderUpdate(order);
        uow.commit();

        out.order = orders_.getOrder(order.id);
        out.result.receipt_no = out.receipt.receipt_no;
        out.result.batch_no = out.receipt.batch_no;
        out.result.quantity = out.receipt.quantity;
        out.result.expiry = expiry;
        return out;
      });

  std::cout << "[ManufacturingOrderService] Completed "
            << outcome.order.order_no << ": " << outcome.result.receipt_no
            << " batch " << outcome.result.batch_no << " qty "
            << outcome.result.quantity << " expiry "
            << (outcome.result.expiry ? outcome.result.expiry->toString()
                                      : "none")
            << "\n";

  publishOrderUpdate(outcome.order, outcome.previous_status);

  ProductionCompletedEvent event;
  event.receipt = outcome.receipt;
  event.order_no = outcome.order.order_no;
  event.lot_id = outcome.result.lot_id;
  event.timestamp_ms = outcome.receipt.received_at_ms;
  event.sequence_id = event_sequence_.next_id();
  bus_.publish(event);

  return outcome.result;
}

// -----------------------------------------------------------------------------
// cancelOrder(): status change only, consumptions stay
// -----------------------------------------------------------------------------
domain::ManufacturingOrder ManufacturingOrderService::cancelOrder(
    domain::OrderId order_id, const std::string& actor) {
  OrderStatus previous = OrderStatus::Confirmed;
  bool consumed_stock = false;

  auto cancelled = runTransaction(
      config_.max_allocation_retries,
      "cancelOrder(" + std::to_string(order_id) + ")", [&] {
        domain::ManufacturingOrder order = orders_.getOrder(order_id);
        OrderStateMachine::requireTransition(order, OrderStatus::Cancelled,
                                             "cancelOrder");
        previous = order.status;

        consumed_stock = false;
        for (const auto& req : orders_.requirementsOf(order_id)) {
          if (req.issued_qty > kQuantityEpsilon) {
            consumed_stock = true;
            break;
          }
        }

        order.status = OrderStatus::Cancelled;
        order.updated_by = actor;
        order.updated_at_ms = time_provider_.now_ms();

        UnitOfWork uow(ledger_, orders_, genealogy_);
        uow.stageOrderUpdate(order);
        uow.commit();
        return orders_.getOrder(order_id);
      });

  if (consumed_stock) {
    std::cerr << "[ManufacturingOrderService] WARNING: cancelled "
              << cancelled.order_no
              << " after materials were issued; consumed lots are not "
                 "returned to stock\n";
  } else {
    std::cout << "[ManufacturingOrderService] Cancelled " << cancelled.order_no
              << "\n";
  }

  publishOrderUpdate(cancelled, previous);
  return cancelled;
}

OrderDetail ManufacturingOrderService::orderDetail(
    domain::OrderId order_id) const {
  OrderDetail detail;
  detail.order = orders_.getOrder(order_id);
  detail.requirements = orders_.requirementsOf(order_id);
  detail.issues = orders_.issuesOf(order_id);
  detail.issue_details = orders_.issueDetailsOf(order_id);
  detail.receipts = orders_.receiptsOf(order_id);
  return detail;
}

std::vector<domain::ManufacturingOrder> ManufacturingOrderService::listOrders(
    const OrderFilter& filter) const {
  return orders_.listOrders(filter);
}

std::vector<domain::MaterialRequirement>
ManufacturingOrderService::requirements(domain::OrderId order_id) const {
  orders_.getOrder(order_id);
  return orders_.requirementsOf(order_id);
}

std::vector<RequirementAvailability>
ManufacturingOrderService::previewRequirements(
    domain::BomId bom_id,
    double planned_qty,
    domain::WarehouseId warehouse_id) const {
  requireWarehouse(warehouse_id, "Source");
  const auto lines = BomExplosionCalculator::explode(
      boms_.get(bom_id), planned_qty,
      ExplosionPolicy{config_.require_active_bom});

  std::vector<MaterialDemand> demands;
  demands.reserve(lines.size());
  for (const auto& line : lines) {
    demands.push_back(MaterialDemand{line.material_id, line.required_qty});
  }
  const auto stock = ledger_.availability(demands, warehouse_id, today());

  std::vector<RequirementAvailability> result;
  result.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    RequirementAvailability row;
    row.line = lines[i];
    row.material_name = stock[i].material_name;
    row.available = stock[i].available;
    row.sufficient = stock[i].sufficient;
    result.push_back(std::move(row));
  }
  return result;
}

domain::Warehouse ManufacturingOrderService::requireWarehouse(
    domain::WarehouseId id, const char* role) const {
  if (id == 0) {
    throw ValidationError(std::string(role) + " warehouse is required");
  }
  auto warehouse = master_data_.findWarehouse(id);
  if (!warehouse) {
    throw NotFoundError(std::string(role) + " warehouse " +
                        std::to_string(id) + " does not exist");
  }
  if (!warehouse->active) {
    throw ValidationError(std::string(role) + " warehouse " +
                          warehouse->name + " is inactive");
  }
  return *warehouse;
}

CalendarDate ManufacturingOrderService::today() const {
  return CalendarDate::fromEpochMs(time_provider_.now_ms());
}

void ManufacturingOrderService::publishOrderUpdate(
    const domain::ManufacturingOrder& order,
    std::optional<OrderStatus> previous) {
  OrderUpdateEvent event;
  event.order = order;
  event.previous_status = previous;
  event.timestamp_ms = order.updated_at_ms;
  event.sequence_id = event_sequence_.next_id();
  bus_.publish(event);
}

}  // namespace mfg
