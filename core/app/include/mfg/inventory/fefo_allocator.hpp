#pragma once

#include "mfg/domain/engine_config.hpp"
#include "mfg/domain/ledger_entry.hpp"
#include "mfg/inventory/inventory_ledger.hpp"
#include "mfg/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mfg {

class UnitOfWork;

// One lot chosen by FEFO and how much is taken from it.
struct LotTake {
  domain::LotId lot_id{};
  std::string batch_no;
  std::optional<CalendarDate> expiry;
  double quantity{0.0};
  std::string uom;
  std::uint64_t observed_version{0};
};

// Stamped onto every PRODUCTION_OUT row an allocation stages.
struct AllocationContext {
  std::string group_id;
  std::string source_ref;  // issue number
  std::string actor;
  std::int64_t timestamp_ms{0};
};

struct PreviewTake {
  domain::LotId lot_id{};
  std::string batch_no;
  double quantity{0.0};
  std::optional<CalendarDate> expiry;
  domain::ExpiryStatus expiry_status{domain::ExpiryStatus::Ok};
};

// Dry-run result. A short preview is still returned; shortfall says by how
// much the request exceeds allocatable stock.
struct AllocationPreview {
  domain::ProductId material_id{};
  domain::WarehouseId warehouse_id{};
  double requested{0.0};
  double available{0.0};
  double shortfall{0.0};
  std::vector<PreviewTake> takes;

  bool sufficient() const { return shortfall <= domain::kQuantityEpsilon; }
};

// -----------------------------------------------------------------------------
// FefoAllocator - First-Expired-First-Out lot selection
// -----------------------------------------------------------------------------
//
// @brief  Chooses which lots satisfy a material need and stages the
//         corresponding consumptions in a UnitOfWork.
//
// @details
// Algorithm (plan):
//   1. Candidates: lots of (material, warehouse) that are live, have
//      remain > 0 and, when allow_expired_issue is off, are not expired.
//   2. Subtract what the current UnitOfWork already staged against each lot
//      so two requirement lines for the same material do not double-count.
//   3. Sort by fefoLess: expiry asc (none last), batch_no asc, lot id asc.
//   4. Greedy walk taking min(remaining need, lot remain).
//   5. If the lots run out first, throw InsufficientStockError. Nothing has
//      been staged at that point, so the caller's UnitOfWork is untouched.
//
// allocate() = plan() + for every take, stage a decrement (with the lot
// version seen by plan) and a PRODUCTION_OUT row. Whether the decrement
// lands is decided at commit by the version check; a concurrent issuance
// that drained the lot first turns into ConcurrencyConflictError and a
// re-plan by runTransaction().
//
// Thread model:
//   Stateless apart from const references and a config copy. Safe to call
//   from any number of threads, each with its own UnitOfWork.
// -----------------------------------------------------------------------------
class FefoAllocator {
 public:
  FefoAllocator(const InventoryLedger& ledger,
                const ITimeProvider& time_provider,
                const domain::EngineConfig& config);

  // Throws ValidationError if needed <= 0, InsufficientStockError if the
  // candidates cannot cover it.
  std::vector<LotTake> plan(domain::ProductId material_id,
                            domain::WarehouseId warehouse_id,
                            double needed,
                            const UnitOfWork* uow = nullptr) const;

  std::vector<LotTake> allocate(domain::ProductId material_id,
                                domain::WarehouseId warehouse_id,
                                double needed,
                                UnitOfWork& uow,
                                const AllocationContext& context) const;

  // Same walk as plan(), never throws for a shortage and stages nothing.
  AllocationPreview previewAllocate(domain::ProductId material_id,
                                    double quantity,
                                    domain::WarehouseId warehouse_id) const;

 private:
  std::vector<domain::LedgerEntry> candidates(domain::ProductId material_id,
                                              domain::WarehouseId warehouse_id,
                                              const UnitOfWork* uow) const;

  CalendarDate today() const;

  const InventoryLedger& ledger_;
  const ITimeProvider& time_provider_;
  domain::EngineConfig config_;
};

}  // namespace mfg
