#pragma once

#include "mfg/concurrent/id_generator.hpp"
#include "mfg/domain/bom.hpp"
#include "mfg/master/i_master_data_registry.hpp"
#include "mfg/time/i_time_provider.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mfg {

// Input of createBom(); the registry assigns id, code, status and version.
struct BomDraft {
  std::string name;
  domain::BomType type{domain::BomType::Kitting};
  domain::ProductId output_product_id{};
  double output_qty{1.0};
  std::string uom;  // defaults to the output product's uom when empty
  std::optional<CalendarDate> effective_date;
  std::string notes;
  std::vector<domain::BomLine> lines;
};

struct BomFilter {
  std::optional<domain::BomType> type;
  std::optional<domain::BomStatus> status;
  std::string search;  // substring of code, name or output product name
};

// One BOM line that consumes a given product.
struct BomUsage {
  domain::BomId bom_id{};
  std::string bom_code;
  std::string bom_name;
  domain::BomStatus bom_status{domain::BomStatus::Draft};
  domain::ProductId output_product_id{};
  std::string output_product_name;
  double qty_per_unit{0.0};
  std::string uom;
  domain::MaterialType material_type{domain::MaterialType::RawMaterial};
};

// Per material, across ACTIVE BOMs only.
struct MaterialUsageRow {
  domain::ProductId material_id{};
  std::string material_name;
  int usage_count{0};          // distinct ACTIVE BOMs using it
  double total_qty_per_unit{0.0};
  std::vector<domain::BomType> bom_types;  // distinct, enum order
};

// -----------------------------------------------------------------------------
// BomRegistry - recipe store with a status table
// -----------------------------------------------------------------------------
//
// @brief  Holds BOM headers and their lines, assigns BOM codes, enforces the
//         DRAFT / ACTIVE / INACTIVE transition table and answers where-used
//         queries.
//
// @details
// BOMs are single-level: a header and a flat list of lines. New BOMs start
// in DRAFT with version 1. Codes are BOM-<KIT|CUT|REP>-NNN with a running
// number per type.
//
// The explosion calculator and order creation only ever read BOMs, and take
// a copy under the shared lock, so a status change racing with createOrder
// is seen either entirely before or entirely after.
//
// Thread model:
//   shared_mutex: createBom()/updateStatus() exclusive, queries shared.
// -----------------------------------------------------------------------------
class BomRegistry {
 public:
  BomRegistry(const IMasterDataRegistry& master_data,
              const ITimeProvider& time_provider);

  BomRegistry(const BomRegistry&) = delete;
  BomRegistry& operator=(const BomRegistry&) = delete;

  // -------------------------------------------------------------------------
  // createBom(draft, actor)
  // -------------------------------------------------------------------------
  // @throws ValidationError  empty name, output quantity <= 0, output product
  //                          is a service, a line with qty_per_unit <= 0 or
  //                          scrap rate outside [0, 100).
  // @throws NotFoundError    output product or a line material is unknown.
  // -------------------------------------------------------------------------
  domain::BomHeader createBom(const BomDraft& draft, const std::string& actor);

  // -------------------------------------------------------------------------
  // updateStatus(bom_id, status, actor)
  // -------------------------------------------------------------------------
  // @throws NotFoundError                unknown BOM.
  // @throws InvalidStateTransitionError  transition not in the table.
  // @throws ValidationError              activating a BOM without lines.
  // -------------------------------------------------------------------------
  domain::BomHeader updateStatus(domain::BomId bom_id,
                                 domain::BomStatus status,
                                 const std::string& actor);

  static bool canTransition(domain::BomStatus from, domain::BomStatus to);

  std::optional<domain::BomHeader> find(domain::BomId bom_id) const;

  // Throws NotFoundError for an unknown id.
  domain::BomHeader get(domain::BomId bom_id) const;

  // Newest first.
  std::vector<domain::BomHeader> list(const BomFilter& filter = {}) const;

  // Lines consuming product_id, ACTIVE BOMs first, then by BOM name.
  std::vector<BomUsage> whereUsed(domain::ProductId product_id) const;

  // Most used first, then by total quantity.
  std::vector<MaterialUsageRow> materialUsageSummary() const;

 private:
  static const char* codePrefix(domain::BomType type);

  const IMasterDataRegistry& master_data_;
  const ITimeProvider& time_provider_;

  mutable std::shared_mutex mutex_;
  std::map<domain::BomId, domain::BomHeader> boms_;
  std::map<domain::BomType, int> last_code_number_;
  IdGenerator ids_;
};

}  // namespace mfg
