#pragma once

#include "mfg/domain/bom.hpp"

#include <string>
#include <vector>

namespace mfg {

// Caller-side rules for which BOMs may be exploded.
struct ExplosionPolicy {
  bool require_active{true};
};

// One material need of a target output quantity.
struct RequirementLine {
  domain::ProductId material_id{};
  double required_qty{0.0};
  std::string uom;
  domain::MaterialType material_type{domain::MaterialType::RawMaterial};
};

// -----------------------------------------------------------------------------
// BomExplosionCalculator - recipe x target quantity -> material requirements
// -----------------------------------------------------------------------------
//
// @brief  Pure function: no state, no I/O, no locks.
//
// @details
// required_qty = qty_per_unit * target_qty * (1 + scrap_rate_pct / 100)
//
// Used twice: createOrder persists the result as MaterialRequirements, and
// the availability preview compares it with stock without persisting
// anything. The BOM's output_qty is informational and does not scale the
// result; qty_per_unit is already per unit of output.
//
// Errors:
//   ValidationError  target_qty is not a positive finite number.
//   NotFoundError    the BOM has no lines, or the policy requires an ACTIVE
//                    BOM and this one is not.
// -----------------------------------------------------------------------------
class BomExplosionCalculator {
 public:
  static std::vector<RequirementLine> explode(const domain::BomHeader& bom,
                                              double target_qty,
                                              const ExplosionPolicy& policy);
};

}  // namespace mfg
