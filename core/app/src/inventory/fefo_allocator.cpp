#include "mfg/inventory/fefo_allocator.hpp"
#include "mfg/errors/errors.hpp"
#include "mfg/store/unit_of_work.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace mfg {

using domain::kQuantityEpsilon;

FefoAllocator::FefoAllocator(const InventoryLedger& ledger,
                             const ITimeProvider& time_provider,
                             const domain::EngineConfig& config)
    : ledger_(ledger), time_provider_(time_provider), config_(config) {}

// -----------------------------------------------------------------------------
// plan(): greedy FEFO walk, all-or-nothing
// -----------------------------------------------------------------------------
std::vector<LotTake> FefoAllocator::plan(domain::ProductId material_id,
                                         domain::WarehouseId warehouse_id,
                                         double needed,
                                         const UnitOfWork* uow) const {
  if (!std::isfinite(needed) || needed <= 0.0) {
    throw ValidationError("Allocation quantity must be positive");
  }

  const auto lots = candidates(material_id, warehouse_id, uow);

  std::vector<LotTake> takes;
  double remaining = needed;
  double available = 0.0;
  for (const auto& lot : lots) {
    available += lot.remain;
    if (remaining <= kQuantityEpsilon) {
      continue;
    }
    LotTake take;
    take.lot_id = lot.id;
    take.batch_no = lot.batch_no;
    take.expiry = lot.expiry;
    take.quantity = std::min(remaining, lot.remain);
    take.uom = lot.uom;
    take.observed_version = lot.version;
    remaining -= take.quantity;
    takes.push_back(std::move(take));
  }

  if (remaining > kQuantityEpsilon) {
    std::ostringstream msg;
    msg << "Insufficient stock for material " << material_id
        << " in warehouse " << warehouse_id << ": requested " << needed
        << ", available " << available;
    throw InsufficientStockError(msg.str(), material_id, warehouse_id, needed,
                                 available);
  }
  return takes;
}

std::vector<LotTake> FefoAllocator::allocate(
    domain::ProductId material_id,
    domain::WarehouseId warehouse_id,
    double needed,
    UnitOfWork& uow,
    const AllocationContext& context) const {
  auto takes = plan(material_id, warehouse_id, needed, &uow);

  for (const auto& take : takes) {
    uow.stageLotDecrement(take.lot_id, take.observed_version, take.quantity);

    domain::LedgerEntry out;
    out.movement = domain::MovementType::ProductionOut;
    out.product_id = material_id;
    out.warehouse_id = warehouse_id;
    out.batch_no = take.batch_no;
    out.quantity = -take.quantity;
    out.remain = 0.0;
    out.uom = take.uom;
    out.expiry = take.expiry;
    out.source_lot_id = take.lot_id;
    out.group_id = context.group_id;
    out.source_ref = context.source_ref;
    out.created_by = context.actor;
    out.created_at_ms = context.timestamp_ms;
    uow.stageLedgerEntry(std::move(out));
  }
  return takes;
}

AllocationPreview FefoAllocator::previewAllocate(
    domain::ProductId material_id,
    double quantity,
    domain::WarehouseId warehouse_id) const {
  if (!std::isfinite(quantity) || quantity <= 0.0) {
    throw ValidationError("Preview quantity must be positive");
  }

  const CalendarDate now = today();
  AllocationPreview preview;
  preview.material_id = material_id;
  preview.warehouse_id = warehouse_id;
  preview.requested = quantity;

  double remaining = quantity;
  for (const auto& lot : candidates(material_id, warehouse_id, nullptr)) {
    preview.available += lot.remain;
    if (remaining <= kQuantityEpsilon) {
      continue;
    }
    PreviewTake take;
    take.lot_id = lot.id;
    take.batch_no = lot.batch_no;
    take.quantity = std::min(remaining, lot.remain);
    take.expiry = lot.expiry;
    take.expiry_status = domain::classifyExpiry(
        lot.expiry, now, config_.expiry_critical_days,
        config_.expiry_warning_days);
    remaining -= take.quantity;
    preview.takes.push_back(std::move(take));
  }
  preview.shortfall = remaining > kQuantityEpsilon ? remaining : 0.0;
  return preview;
}

std::vector<domain::LedgerEntry> FefoAllocator::candidates(
    domain::ProductId material_id,
    domain::WarehouseId warehouse_id,
    const UnitOfWork* uow) const {
  auto lots = ledger_.allocatableLots(material_id, warehouse_id, today());

  if (uow != nullptr) {
    for (auto& lot : lots) {
      lot.remain -= uow->stagedDecrement(lot.id);
    }
    lots.erase(std::remove_if(lots.begin(), lots.end(),
                              [](const domain::LedgerEntry& lot) {
                                return lot.remain <= kQuantityEpsilon;
                              }),
               lots.end());
  }

  std::sort(lots.begin(), lots.end(), domain::fefoLess);
  return lots;
}

CalendarDate FefoAllocator::today() const {
  return CalendarDate::fromEpochMs(time_provider_.now_ms());
}

}  // namespace mfg
