#pragma once

#include "mfg/domain/bom.hpp"
#include "mfg/domain/identifiers.hpp"
#include "mfg/domain/order_status.hpp"
#include "mfg/time/calendar_date.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// ManufacturingOrder
// -----------------------------------------------------------------------------
// Responsibility: Root of one production workflow: which recipe, how much,
// from which warehouse the materials come and where the output goes.
//
// @details
// The authoritative copy lives in OrderRepository and is only replaced by a
// committed UnitOfWork. Copies handed out by queries and events are
// snapshots. `version` starts at 1 and is bumped by every committed change;
// a UnitOfWork that observed an older version fails its commit.
// -----------------------------------------------------------------------------
struct ManufacturingOrder {
  OrderId id{};
  std::string order_no;  // MO-YYYYMMDDHHMMSS-NNNN
  EntityId entity_id{};  // taken from the source warehouse
  BomId bom_id{};
  BomType bom_type{BomType::Kitting};
  ProductId product_id{};
  double planned_qty{0.0};
  double produced_qty{0.0};
  std::string uom;
  WarehouseId source_warehouse_id{};
  WarehouseId target_warehouse_id{};
  OrderStatus status{OrderStatus::Confirmed};
  Priority priority{Priority::Normal};
  CalendarDate order_date;
  std::optional<CalendarDate> scheduled_date;
  std::optional<CalendarDate> completion_date;
  std::string notes;
  std::string created_by;
  std::string updated_by;
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
  std::uint64_t version{1};
};

// -----------------------------------------------------------------------------
// MaterialRequirement
// -----------------------------------------------------------------------------
// One exploded BOM line of an order. Created once at order creation and only
// mutated by issuance. 0 <= issued_qty <= required_qty at all times.
// -----------------------------------------------------------------------------
struct MaterialRequirement {
  RequirementId id{};
  OrderId order_id{};
  ProductId material_id{};
  MaterialType material_type{MaterialType::RawMaterial};
  double required_qty{0.0};
  double issued_qty{0.0};
  std::string uom;
  WarehouseId warehouse_id{};
  RequirementStatus status{RequirementStatus::Pending};
};

}  // namespace domain
}  // namespace mfg
