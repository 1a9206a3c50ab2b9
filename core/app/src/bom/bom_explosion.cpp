#include "mfg/bom/bom_explosion.hpp"
#include "mfg/errors/errors.hpp"

#include <cmath>

namespace mfg {

std::vector<RequirementLine> BomExplosionCalculator::explode(
    const domain::BomHeader& bom,
    double target_qty,
    const ExplosionPolicy& policy) {
  if (!std::isfinite(target_qty) || target_qty <= 0.0) {
    throw ValidationError("Target quantity must be positive");
  }
  if (policy.require_active && bom.status != domain::BomStatus::Active) {
    throw NotFoundError("No active BOM " + bom.code + " (status " +
                        domain::toString(bom.status) + ")");
  }
  if (bom.lines.empty()) {
    throw NotFoundError("BOM " + bom.code + " has no materials");
  }

  std::vector<RequirementLine> result;
  result.reserve(bom.lines.size());
  for (const auto& line : bom.lines) {
    RequirementLine req;
    req.material_id = line.material_id;
    req.required_qty =
        line.qty_per_unit * target_qty * (1.0 + line.scrap_rate_pct / 100.0);
    req.uom = line.uom;
    req.material_type = line.material_type;
    result.push_back(std::move(req));
  }
  return result;
}

}  // namespace mfg
