#pragma once

#include "mfg/bom/bom_registry.hpp"
#include "mfg/domain/engine_config.hpp"
#include "mfg/domain/genealogy_link.hpp"
#include "mfg/domain/production_receipt.hpp"
#include "mfg/inventory/inventory_ledger.hpp"
#include "mfg/master/i_master_data_registry.hpp"
#include "mfg/production/order_repository.hpp"
#include "mfg/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mfg {

class UnitOfWork;

// Backward trace: a material lot that went into a produced batch.
struct BatchSource {
  domain::ProductId material_id{};
  std::string material_name;
  double quantity{0.0};
  std::string source_batch_no;
  std::optional<CalendarDate> source_expiry;
};

enum class BatchLocationStatus {
  Available,
  Expired,
};

inline const char* toString(BatchLocationStatus status) {
  switch (status) {
    case BatchLocationStatus::Available: return "AVAILABLE";
    case BatchLocationStatus::Expired:   return "EXPIRED";
  }
  return "UNKNOWN";
}

// Forward trace: where stock of a batch still sits.
struct BatchLocation {
  domain::WarehouseId warehouse_id{};
  std::string warehouse_name;
  double remaining_qty{0.0};
  BatchLocationStatus status{BatchLocationStatus::Available};
};

struct BatchInfo {
  std::string batch_no;
  domain::ProductId product_id{};
  std::string product_name;
  std::string product_code;
  double produced_qty{0.0};
  std::string uom;
  std::optional<CalendarDate> expiry;
  std::int64_t first_received_at_ms{0};
  domain::WarehouseId warehouse_id{};
  std::string warehouse_name;
};

struct ProducedBatch {
  std::string batch_no;
  std::string receipt_no;
  std::int64_t received_at_ms{0};
  std::string product_name;
  double quantity{0.0};
  domain::QualityStatus quality_status{domain::QualityStatus::Pending};
};

// -----------------------------------------------------------------------------
// GenealogyTracker - consumed-lot -> produced-batch traceability
// -----------------------------------------------------------------------------
//
// @brief  Stores one GenealogyLink per consumption written by an issuance,
//         derives the inherited expiry of KITTING output, and answers the
//         forward/backward traceability queries.
//
// @details
// Links are written only by UnitOfWork::commit() (friend), in the same
// critical section as the PRODUCTION_OUT ledger rows they mirror, so a link
// never exists without its consumption and vice versa.
//
// Inherited expiry:
//   min(source_expiry) over the links of an order, ignoring lots without an
//   expiry; std::nullopt when no consumed lot had one. A kit is only as
//   fresh as its first-expiring component.
//
// Queries read links here plus receipts (OrderRepository), lots
// (InventoryLedger) and BOM lines (BomRegistry). Each store is read under
// its own shared lock, one after another; results are advisory snapshots.
//
// Thread model:
//   shared_mutex on links_; every public method is safe from any thread.
// -----------------------------------------------------------------------------
class GenealogyTracker {
 public:
  GenealogyTracker(const InventoryLedger& ledger,
                   const OrderRepository& orders,
                   const BomRegistry& boms,
                   const IMasterDataRegistry& master_data,
                   const ITimeProvider& time_provider);

  GenealogyTracker(const GenealogyTracker&) = delete;
  GenealogyTracker& operator=(const GenealogyTracker&) = delete;

  std::vector<domain::GenealogyLink> linksFor(domain::OrderId order_id) const;

  std::optional<CalendarDate> inheritedExpiry(domain::OrderId order_id) const;

  // BOM lines consuming the product (reads recipes, not links).
  std::vector<BomUsage> whereUsed(domain::ProductId product_id) const;

  // Materials that went into every receipt carrying batch_no, by name.
  std::vector<BatchSource> sourcesOf(const std::string& batch_no) const;

  // Live stock of batch_no grouped by warehouse and status. Exhausted lots
  // are omitted.
  std::vector<BatchLocation> locationsOf(const std::string& batch_no) const;

  // Production details of a batch; std::nullopt if no PRODUCTION_IN lot
  // carries that batch number.
  std::optional<BatchInfo> batchInfo(const std::string& batch_no) const;

  // Receipts of an order. Throws NotFoundError for an unknown order number.
  std::vector<ProducedBatch> batchesProducedBy(
      const std::string& order_no) const;

  std::size_t linkCount() const;

 private:
  friend class UnitOfWork;

  // Caller holds mutex_ exclusively.
  void appendLocked(domain::GenealogyLink link);

  const InventoryLedger& ledger_;
  const OrderRepository& orders_;
  const BomRegistry& boms_;
  const IMasterDataRegistry& master_data_;
  const ITimeProvider& time_provider_;

  mutable std::shared_mutex mutex_;
  std::vector<domain::GenealogyLink> links_;
};

}  // namespace mfg
