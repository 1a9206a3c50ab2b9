#pragma once

#include "mfg/concurrent/id_generator.hpp"
#include "mfg/domain/engine_config.hpp"
#include "mfg/domain/ledger_entry.hpp"
#include "mfg/master/i_master_data_registry.hpp"
#include "mfg/time/calendar_date.hpp"
#include "mfg/time/i_time_provider.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace mfg {

class UnitOfWork;

// Opening stock or a purchase receipt: creates one STOCK_IN lot.
struct StockReceiptRequest {
  domain::ProductId product_id{};
  domain::WarehouseId warehouse_id{};
  std::string batch_no;
  double quantity{0.0};
  std::optional<CalendarDate> expiry;
  std::string source_ref;  // supplier document, free text
};

// One (batch, expiry) group of a product/warehouse, in FEFO order.
struct LotBreakdownRow {
  std::string batch_no;
  std::optional<CalendarDate> expiry;
  double available_qty{0.0};
  domain::ExpiryStatus status{domain::ExpiryStatus::Ok};
  int lot_count{0};
};

struct ExpiryReportRow {
  domain::ProductId product_id{};
  std::string product_name;
  std::string batch_no;
  domain::WarehouseId warehouse_id{};
  std::string warehouse_name;
  double quantity{0.0};
  CalendarDate expiry;
  domain::ExpiryStatus status{domain::ExpiryStatus::Ok};
  int days_to_expiry{0};
};

struct ProductionImpactRow {
  domain::ProductId product_id{};
  std::string product_name;
  double produced{0.0};
  double consumed{0.0};
  double net_change{0.0};
};

struct MaterialDemand {
  domain::ProductId material_id{};
  double quantity{0.0};
};

struct AvailabilityRow {
  domain::ProductId material_id{};
  std::string material_name;
  double required{0.0};
  double available{0.0};
  bool sufficient{false};
};

// -----------------------------------------------------------------------------
// InventoryLedger - append-only stock movement log and source of truth for
//                   balances
// -----------------------------------------------------------------------------
//
// @brief  Stores every LedgerEntry the engine ever committed and answers
//         balance, lot and movement queries over them.
//
// @details
// Inbound rows (STOCK_IN, PRODUCTION_IN) are lots: each has a `remain` that
// FEFO allocation decrements. PRODUCTION_OUT rows record one consumption
// each, with a negative quantity and source_lot_id pointing at the lot.
// Rows are never deleted.
//
// Write paths:
//   1. receiveStock(): a single new lot, written directly under the
//      exclusive lock (one row is trivially atomic).
//   2. UnitOfWork::commit(): multi-row changes (lot decrements, new OUT and
//      PRODUCTION_IN rows) applied under the exclusive lock together with
//      OrderRepository and GenealogyTracker. UnitOfWork is a friend for
//      that reason; nothing else mutates entries_.
//
// Balance law:
//   For any product/warehouse, netQuantity() (sum of signed quantities)
//   equals balance() (sum of remain over lots). Every committed decrement
//   of `remain` is paired with a PRODUCTION_OUT row of the same magnitude.
//
// Thread model:
//   Queries take a shared_lock and return deep copies, safe to use from any
//   thread after the call returns. They never observe a half-applied
//   UnitOfWork.
//
// Ownership:
//   Owned by ManufacturingEngine via std::unique_ptr. Holds const references
//   to the master-data registry and time provider, which must outlive it.
// -----------------------------------------------------------------------------
class InventoryLedger {
 public:
  InventoryLedger(const IMasterDataRegistry& master_data,
                  const ITimeProvider& time_provider,
                  const domain::EngineConfig& config);

  InventoryLedger(const InventoryLedger&) = delete;
  InventoryLedger& operator=(const InventoryLedger&) = delete;

  // -------------------------------------------------------------------------
  // receiveStock(request, actor)
  // -------------------------------------------------------------------------
  // @brief  Appends a STOCK_IN lot with quantity = remain = request.quantity.
  //
  // @throws NotFoundError    unknown product or warehouse.
  // @throws ValidationError  product is a service or unapproved, warehouse
  //                          inactive, quantity <= 0, empty batch number.
  // -------------------------------------------------------------------------
  domain::LedgerEntry receiveStock(const StockReceiptRequest& request,
                                   const std::string& actor);

  std::optional<domain::LedgerEntry> findEntry(domain::LotId id) const;

  // Every row, ordered by id. Used for snapshot comparisons and reports.
  std::vector<domain::LedgerEntry> entries() const;

  // Inbound rows for one product/warehouse, exhausted ones included,
  // ordered by id. FefoAllocator filters and sorts these.
  std::vector<domain::LedgerEntry> lots(domain::ProductId product_id,
                                        domain::WarehouseId warehouse_id) const;

  // Lots FEFO may draw from on `today`: live, remain > 0 and, when
  // allow_expired_issue is off, not yet expired. Unsorted.
  std::vector<domain::LedgerEntry> allocatableLots(
      domain::ProductId product_id,
      domain::WarehouseId warehouse_id,
      CalendarDate today) const;

  // Inbound rows carrying the batch number, any product or warehouse.
  std::vector<domain::LedgerEntry> lotsByBatch(
      const std::string& batch_no) const;

  // Sum of remain over live lots. No warehouse means all warehouses.
  double balance(domain::ProductId product_id,
                 std::optional<domain::WarehouseId> warehouse_id =
                     std::nullopt) const;

  // Sum of signed quantity over every row, inbound and outbound.
  double netQuantity(domain::ProductId product_id,
                     std::optional<domain::WarehouseId> warehouse_id =
                         std::nullopt) const;

  // -------------------------------------------------------------------------
  // lotBreakdown(product, warehouse, today)
  // -------------------------------------------------------------------------
  // @brief  Live lots grouped by (batch, expiry) in FEFO order, each group
  //         classified EXPIRED / CRITICAL / WARNING / OK against `today`
  //         using the configured thresholds.
  // -------------------------------------------------------------------------
  std::vector<LotBreakdownRow> lotBreakdown(domain::ProductId product_id,
                                            domain::WarehouseId warehouse_id,
                                            CalendarDate today) const;

  // Live lots expiring on or before today + days_ahead (already expired
  // ones included), soonest first.
  std::vector<ExpiryReportRow> expiryReport(int days_ahead,
                                            CalendarDate today) const;

  // Every row of a product, newest first.
  std::vector<domain::LedgerEntry> movements(
      domain::ProductId product_id,
      std::optional<domain::WarehouseId> warehouse_id = std::nullopt) const;

  // Produced / consumed / net per product over PRODUCTION_IN and
  // PRODUCTION_OUT rows created in [from, to]. Products with zero net
  // change are omitted; largest absolute change first.
  std::vector<ProductionImpactRow> productionImpact(CalendarDate from,
                                                    CalendarDate to) const;

  // Compares each demand with the allocatable stock in one warehouse.
  // Honors allow_expired_issue like FEFO does.
  std::vector<AvailabilityRow> availability(
      const std::vector<MaterialDemand>& demands,
      domain::WarehouseId warehouse_id,
      CalendarDate today) const;

  std::size_t size() const;

 private:
  friend class UnitOfWork;

  using Location = std::pair<domain::ProductId, domain::WarehouseId>;

  // Caller holds mutex_ exclusively.
  domain::LedgerEntry* findLocked(domain::LotId id);
  void appendLocked(domain::LedgerEntry entry);

  bool isAllocatable(const domain::LedgerEntry& entry,
                     CalendarDate today) const;

  domain::LotId nextEntryId() { return ids_.next_id(); }

  const IMasterDataRegistry& master_data_;
  const ITimeProvider& time_provider_;
  domain::EngineConfig config_;

  mutable std::shared_mutex mutex_;
  std::map<domain::LotId, domain::LedgerEntry> entries_;
  std::map<Location, std::vector<domain::LotId>> lots_by_location_;
  IdGenerator ids_;
};

}  // namespace mfg
