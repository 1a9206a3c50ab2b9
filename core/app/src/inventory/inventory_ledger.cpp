#include "mfg/inventory/inventory_ledger.hpp"
#include "mfg/errors/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <tuple>
#include <unordered_map>

namespace mfg {

using domain::kQuantityEpsilon;
using domain::LedgerEntry;
using domain::MovementType;

InventoryLedger::InventoryLedger(const IMasterDataRegistry& master_data,
                                 const ITimeProvider& time_provider,
                                 const domain::EngineConfig& config)
    : master_data_(master_data),
      time_provider_(time_provider),
      config_(config) {}

// -----------------------------------------------------------------------------
// receiveStock(): validate against master data, then append one lot
// -----------------------------------------------------------------------------
LedgerEntry InventoryLedger::receiveStock(const StockReceiptRequest& request,
                                          const std::string& actor) {
  auto product = master_data_.findProduct(request.product_id);
  if (!product) {
    throw NotFoundError("Unknown product id " +
                        std::to_string(request.product_id));
  }
  if (product->is_service) {
    throw ValidationError("Product " + product->code +
                          " is a service and carries no stock");
  }
  if (!product->approved) {
    throw ValidationError("Product " + product->code + " is not approved");
  }

  auto warehouse = master_data_.findWarehouse(request.warehouse_id);
  if (!warehouse) {
    throw NotFoundError("Unknown warehouse id " +
                        std::to_string(request.warehouse_id));
  }
  if (!warehouse->active) {
    throw ValidationError("Warehouse " + warehouse->name + " is inactive");
  }

  if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
    throw ValidationError("Received quantity must be positive");
  }
  if (request.batch_no.empty()) {
    throw ValidationError("Batch number is required");
  }

  LedgerEntry entry;
  entry.id = nextEntryId();
  entry.movement = MovementType::StockIn;
  entry.product_id = request.product_id;
  entry.warehouse_id = request.warehouse_id;
  entry.batch_no = request.batch_no;
  entry.quantity = request.quantity;
  entry.remain = request.quantity;
  entry.uom = product->uom;
  entry.expiry = request.expiry;
  entry.source_ref = request.source_ref;
  entry.created_by = actor;
  entry.created_at_ms = time_provider_.now_ms();

  {
    std::unique_lock lock(mutex_);
    appendLocked(entry);
  }

  std::cout << "[InventoryLedger] Received " << entry.quantity << " "
            << entry.uom << " of " << product->code << " batch "
            << entry.batch_no << " into " << warehouse->name << "\n";
  return entry;
}

std::optional<LedgerEntry> InventoryLedger::findEntry(domain::LotId id) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<LedgerEntry> InventoryLedger::entries() const {
  std::shared_lock lock(mutex_);
  std::vector<LedgerEntry> result;
  result.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    result.push_back(entry);
  }
  return result;
}

std::vector<LedgerEntry> InventoryLedger::lots(
    domain::ProductId product_id, domain::WarehouseId warehouse_id) const {
  std::shared_lock lock(mutex_);
  std::vector<LedgerEntry> result;

  auto it = lots_by_location_.find({product_id, warehouse_id});
  if (it == lots_by_location_.end()) {
    return result;
  }

  result.reserve(it->second.size());
  for (domain::LotId id : it->second) {
    result.push_back(entries_.at(id));
  }
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.id < b.id; });
  return result;
}

std::vector<LedgerEntry> InventoryLedger::allocatableLots(
    domain::ProductId product_id,
    domain::WarehouseId warehouse_id,
    CalendarDate today) const {
  std::vector<LedgerEntry> result;
  for (auto& lot : lots(product_id, warehouse_id)) {
    if (isAllocatable(lot, today)) {
      result.push_back(std::move(lot));
    }
  }
  return result;
}

std::vector<LedgerEntry> InventoryLedger::lotsByBatch(
    const std::string& batch_no) const {
  std::shared_lock lock(mutex_);
  std::vector<LedgerEntry> result;
  for (const auto& [id, entry] : entries_) {
    if (domain::isInbound(entry.movement) && entry.batch_no == batch_no) {
      result.push_back(entry);
    }
  }
  return result;
}

double InventoryLedger::balance(
    domain::ProductId product_id,
    std::optional<domain::WarehouseId> warehouse_id) const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [id, entry] : entries_) {
    if (entry.product_id != product_id || entry.deleted ||
        !domain::isInbound(entry.movement)) {
      continue;
    }
    if (warehouse_id && entry.warehouse_id != *warehouse_id) {
      continue;
    }
    total += entry.remain;
  }
  return total;
}

double InventoryLedger::netQuantity(
    domain::ProductId product_id,
    std::optional<domain::WarehouseId> warehouse_id) const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [id, entry] : entries_) {
    if (entry.product_id != product_id || entry.deleted) {
      continue;
    }
    if (warehouse_id && entry.warehouse_id != *warehouse_id) {
      continue;
    }
    total += entry.quantity;
  }
  return total;
}

// -----------------------------------------------------------------------------
// lotBreakdown(): group live lots by (batch, expiry), FEFO order
// -----------------------------------------------------------------------------
std::vector<LotBreakdownRow> InventoryLedger::lotBreakdown(
    domain::ProductId product_id,
    domain::WarehouseId warehouse_id,
    CalendarDate today) const {
  std::vector<LedgerEntry> live;
  for (auto& lot : lots(product_id, warehouse_id)) {
    if (!lot.deleted && lot.remain > kQuantityEpsilon) {
      live.push_back(std::move(lot));
    }
  }
  std::sort(live.begin(), live.end(), domain::fefoLess);

  std::vector<LotBreakdownRow> rows;
  for (const auto& lot : live) {
    if (!rows.empty() && rows.back().batch_no == lot.batch_no &&
        rows.back().expiry == lot.expiry) {
      rows.back().available_qty += lot.remain;
      ++rows.back().lot_count;
      continue;
    }
    LotBreakdownRow row;
    row.batch_no = lot.batch_no;
    row.expiry = lot.expiry;
    row.available_qty = lot.remain;
    row.status = domain::classifyExpiry(lot.expiry, today,
                                        config_.expiry_critical_days,
                                        config_.expiry_warning_days);
    row.lot_count = 1;
    rows.push_back(std::move(row));
  }
  return rows;
}

// -----------------------------------------------------------------------------
// expiryReport(): live lots expiring within the horizon
// -----------------------------------------------------------------------------
std::vector<ExpiryReportRow> InventoryLedger::expiryReport(
    int days_ahead, CalendarDate today) const {
  if (days_ahead < 0) {
    throw ValidationError("days_ahead must be non-negative");
  }
  const CalendarDate horizon = today.addDays(days_ahead);

  // (product, warehouse, batch, expiry) -> quantity
  using Key = std::tuple<domain::ProductId, domain::WarehouseId, std::string,
                         std::int32_t>;
  std::map<Key, double> grouped;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (!domain::isInbound(entry.movement) || entry.deleted ||
          entry.remain <= kQuantityEpsilon || !entry.expiry ||
          *entry.expiry > horizon) {
        continue;
      }
      grouped[Key{entry.product_id, entry.warehouse_id, entry.batch_no,
                  entry.expiry->daysSinceEpoch()}] += entry.remain;
    }
  }

  std::vector<ExpiryReportRow> rows;
  rows.reserve(grouped.size());
  for (const auto& [key, quantity] : grouped) {
    ExpiryReportRow row;
    row.product_id = std::get<0>(key);
    row.product_name = productName(master_data_, row.product_id);
    row.warehouse_id = std::get<1>(key);
    row.warehouse_name = warehouseName(master_data_, row.warehouse_id);
    row.batch_no = std::get<2>(key);
    row.expiry = CalendarDate::fromDays(std::get<3>(key));
    row.quantity = quantity;
    // The horizon is the WARNING bound: a row that is not critical is a
    // warning.
    row.status = domain::classifyExpiry(row.expiry, today,
                                        config_.expiry_critical_days,
                                        std::max(days_ahead,
                                                 config_.expiry_critical_days));
    row.days_to_expiry = daysBetween(today, row.expiry);
    rows.push_back(std::move(row));
  }

  std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return a.expiry < b.expiry;
  });
  return rows;
}

std::vector<LedgerEntry> InventoryLedger::movements(
    domain::ProductId product_id,
    std::optional<domain::WarehouseId> warehouse_id) const {
  std::vector<LedgerEntry> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (entry.product_id != product_id) {
        continue;
      }
      if (warehouse_id && entry.warehouse_id != *warehouse_id) {
        continue;
      }
      result.push_back(entry);
    }
  }
  std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) {
      return a.created_at_ms > b.created_at_ms;
    }
    return a.id > b.id;
  });
  return result;
}

// -----------------------------------------------------------------------------
// productionImpact(): produced vs consumed per product in a date range
// -----------------------------------------------------------------------------
std::vector<ProductionImpactRow> InventoryLedger::productionImpact(
    CalendarDate from, CalendarDate to) const {
  if (to < from) {
    throw ValidationError("Date range end precedes its start");
  }

  std::map<domain::ProductId, ProductionImpactRow> by_product;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (entry.deleted || entry.movement == MovementType::StockIn) {
        continue;
      }
      const CalendarDate day = CalendarDate::fromEpochMs(entry.created_at_ms);
      if (day < from || day > to) {
        continue;
      }
      auto& row = by_product[entry.product_id];
      row.product_id = entry.product_id;
      if (entry.movement == MovementType::ProductionIn) {
        row.produced += entry.quantity;
      } else {
        row.consumed += -entry.quantity;
      }
    }
  }

  std::vector<ProductionImpactRow> rows;
  for (auto& [product_id, row] : by_product) {
    row.net_change = row.produced - row.consumed;
    if (std::fabs(row.net_change) <= kQuantityEpsilon) {
      continue;
    }
    row.product_name = productName(master_data_, product_id);
    rows.push_back(std::move(row));
  }
  std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return std::fabs(a.net_change) > std::fabs(b.net_change);
  });
  return rows;
}

std::vector<AvailabilityRow> InventoryLedger::availability(
    const std::vector<MaterialDemand>& demands,
    domain::WarehouseId warehouse_id,
    CalendarDate today) const {
  std::vector<AvailabilityRow> rows;
  rows.reserve(demands.size());

  for (const auto& demand : demands) {
    double available = 0.0;
    for (const auto& lot :
         allocatableLots(demand.material_id, warehouse_id, today)) {
      available += lot.remain;
    }

    AvailabilityRow row;
    row.material_id = demand.material_id;
    row.material_name = productName(master_data_, demand.material_id);
    row.required = demand.quantity;
    row.available = available;
    row.sufficient = available + kQuantityEpsilon >= demand.quantity;
    rows.push_back(std::move(row));
  }
  return rows;
}

std::size_t InventoryLedger::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

bool InventoryLedger::isAllocatable(const LedgerEntry& entry,
                                    CalendarDate today) const {
  if (entry.deleted || !domain::isInbound(entry.movement) ||
      entry.remain <= kQuantityEpsilon) {
    return false;
  }
  if (!config_.allow_expired_issue && entry.expiry && *entry.expiry < today) {
    return false;
  }
  return true;
}

LedgerEntry* InventoryLedger::findLocked(domain::LotId id) {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

void InventoryLedger::appendLocked(LedgerEntry entry) {
  if (domain::isInbound(entry.movement)) {
    lots_by_location_[{entry.product_id, entry.warehouse_id}].push_back(
        entry.id);
  }
  const domain::LotId id = entry.id;
  entries_.emplace(id, std::move(entry));
}

}  // namespace mfg
