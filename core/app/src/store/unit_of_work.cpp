#include "mfg/store/unit_of_work.hpp"
#include "mfg/genealogy/genealogy_tracker.hpp"
#include "mfg/inventory/inventory_ledger.hpp"
#include "mfg/production/order_repository.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace mfg {

using domain::kQuantityEpsilon;

UnitOfWork::UnitOfWork(InventoryLedger& ledger,
                       OrderRepository& orders,
                       GenealogyTracker& genealogy)
    : ledger_(ledger), orders_(orders), genealogy_(genealogy) {}

void UnitOfWork::stageLotDecrement(domain::LotId lot_id,
                                   std::uint64_t observed_version,
                                   double quantity) {
  requireOpen();
  decrements_.push_back(LotDecrement{lot_id, observed_version, quantity});
  decrement_totals_[lot_id] += quantity;
}

domain::LotId UnitOfWork::stageLedgerEntry(domain::LedgerEntry entry) {
  requireOpen();
  if (entry.id == 0) {
    entry.id = ledger_.nextEntryId();
  }
  const domain::LotId id = entry.id;
  new_entries_.push_back(std::move(entry));
  return id;
}

double UnitOfWork::stagedDecrement(domain::LotId lot_id) const {
  auto it = decrement_totals_.find(lot_id);
  return it == decrement_totals_.end() ? 0.0 : it->second;
}

domain::OrderId UnitOfWork::stageNewOrder(
    domain::ManufacturingOrder order,
    std::vector<domain::MaterialRequirement> requirements) {
  requireOpen();
  order.id = orders_.order_ids_.next_id();
  order.version = 1;
  for (auto& requirement : requirements) {
    requirement.id = orders_.requirement_ids_.next_id();
    requirement.order_id = order.id;
    new_requirements_.push_back(std::move(requirement));
  }
  const domain::OrderId id = order.id;
  new_orders_.push_back(std::move(order));
  return id;
}

void UnitOfWork::stageOrderUpdate(domain::ManufacturingOrder order) {
  requireOpen();
  auto it = order_updates_.find(order.id);
  if (it != order_updates_.end()) {
    // Keep the version first observed; the latest field values win.
    order.version = it->second.version;
    it->second = std::move(order);
    return;
  }
  const domain::OrderId id = order.id;
  order_updates_.emplace(id, std::move(order));
}

void UnitOfWork::stageRequirementUpdate(
    domain::MaterialRequirement requirement) {
  requireOpen();
  requirement_updates_.push_back(std::move(requirement));
}

domain::IssueId UnitOfWork::stageIssue(domain::MaterialIssue issue) {
  requireOpen();
  issue.id = orders_.issue_ids_.next_id();
  const domain::IssueId id = issue.id;
  issues_.push_back(std::move(issue));
  return id;
}

void UnitOfWork::stageIssueDetail(domain::IssueDetail detail) {
  requireOpen();
  detail.id = orders_.issue_detail_ids_.next_id();
  issue_details_.push_back(std::move(detail));
}

domain::ReceiptId UnitOfWork::stageReceipt(domain::ProductionReceipt receipt) {
  requireOpen();
  receipt.id = orders_.receipt_ids_.next_id();
  const domain::ReceiptId id = receipt.id;
  receipts_.push_back(std::move(receipt));
  return id;
}

void UnitOfWork::stageGenealogyLink(domain::GenealogyLink link) {
  requireOpen();
  links_.push_back(std::move(link));
}

bool UnitOfWork::empty() const {
  return decrements_.empty() && new_entries_.empty() && new_orders_.empty() &&
         order_updates_.empty() && requirement_updates_.empty() &&
         issues_.empty() && issue_details_.empty() && receipts_.empty() &&
         links_.empty();
}

// -----------------------------------------------------------------------------
// commit(): lock all stores, validate observed versions, apply
// -----------------------------------------------------------------------------
void UnitOfWork::commit() {
  requireOpen();

  std::scoped_lock lock(ledger_.mutex_, orders_.mutex_, genealogy_.mutex_);
  validateLocked();
  applyLocked();
  committed_ = true;
}

void UnitOfWork::validateLocked() {
  for (const auto& d : decrements_) {
    const domain::LedgerEntry* lot = ledger_.findLocked(d.lot_id);
    if (lot == nullptr || lot->deleted || !domain::isInbound(lot->movement)) {
      throw ConcurrencyConflictError("Lot " + std::to_string(d.lot_id) +
                                     " is no longer available");
    }
    if (lot->version != d.observed_version) {
      throw ConcurrencyConflictError(
          "Lot " + std::to_string(d.lot_id) + " (batch " + lot->batch_no +
          ") changed since it was read: version " +
          std::to_string(d.observed_version) + " -> " +
          std::to_string(lot->version));
    }
  }

  for (const auto& [lot_id, total] : decrement_totals_) {
    const domain::LedgerEntry* lot = ledger_.findLocked(lot_id);
    if (lot->remain + kQuantityEpsilon < total) {
      throw ConcurrencyConflictError(
          "Lot " + std::to_string(lot_id) + " remain " +
          std::to_string(lot->remain) + " cannot cover " +
          std::to_string(total));
    }
  }

  for (const auto& [order_id, staged] : order_updates_) {
    const domain::ManufacturingOrder* current =
        orders_.findOrderLocked(order_id);
    if (current == nullptr) {
      throw ConcurrencyConflictError("Order " + std::to_string(order_id) +
                                     " disappeared");
    }
    if (current->version != staged.version) {
      throw ConcurrencyConflictError(
          "Order " + current->order_no + " changed since it was read: version " +
          std::to_string(staged.version) + " -> " +
          std::to_string(current->version));
    }
  }

  for (const auto& requirement : requirement_updates_) {
    if (orders_.findRequirementLocked(requirement.id) == nullptr) {
      throw ConcurrencyConflictError("Requirement " +
                                     std::to_string(requirement.id) +
                                     " disappeared");
    }
    if (order_updates_.count(requirement.order_id) == 0) {
      throw std::logic_error(
          "Requirement update staged without its order update");
    }
  }

  std::unordered_set<std::string> new_numbers;
  for (const auto& order : new_orders_) {
    if (orders_.orderNoTakenLocked(order.order_no) ||
        !new_numbers.insert(order.order_no).second) {
      throw ConcurrencyConflictError("Order number " + order.order_no +
                                     " already exists");
    }
  }
}

void UnitOfWork::applyLocked() {
  for (const auto& [lot_id, total] : decrement_totals_) {
    domain::LedgerEntry* lot = ledger_.findLocked(lot_id);
    lot->remain -= total;
    if (lot->remain < kQuantityEpsilon) {
      lot->remain = 0.0;
    }
    ++lot->version;
  }
  for (auto& entry : new_entries_) {
    ledger_.appendLocked(entry);
  }

  for (auto& order : new_orders_) {
    orders_.insertOrderLocked(order);
  }
  for (auto& requirement : new_requirements_) {
    orders_.insertRequirementLocked(requirement);
  }
  for (auto& [order_id, staged] : order_updates_) {
    domain::ManufacturingOrder* current = orders_.findOrderLocked(order_id);
    const std::uint64_t next_version = current->version + 1;
    *current = staged;
    current->version = next_version;
  }
  for (auto& requirement : requirement_updates_) {
    *orders_.findRequirementLocked(requirement.id) = requirement;
  }
  orders_.issues_.insert(orders_.issues_.end(), issues_.begin(),
                         issues_.end());
  orders_.issue_details_.insert(orders_.issue_details_.end(),
                                issue_details_.begin(), issue_details_.end());
  orders_.receipts_.insert(orders_.receipts_.end(), receipts_.begin(),
                           receipts_.end());

  for (auto& link : links_) {
    genealogy_.appendLocked(link);
  }
}

void UnitOfWork::requireOpen() const {
  if (committed_) {
    throw std::logic_error("UnitOfWork already committed");
  }
}

}  // namespace mfg
