#include "mfg/bom/bom_registry.hpp"
#include "mfg/errors/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <set>

namespace mfg {

using domain::BomHeader;
using domain::BomStatus;
using domain::BomType;

namespace {

bool containsText(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

BomRegistry::BomRegistry(const IMasterDataRegistry& master_data,
                         const ITimeProvider& time_provider)
    : master_data_(master_data), time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// createBom(): validate, assign code, store as DRAFT v1
// -----------------------------------------------------------------------------
BomHeader BomRegistry::createBom(const BomDraft& draft,
                                 const std::string& actor) {
  if (draft.name.empty()) {
    throw ValidationError("BOM name is required");
  }
  if (!std::isfinite(draft.output_qty) || draft.output_qty <= 0.0) {
    throw ValidationError("BOM output quantity must be positive");
  }

  auto output = master_data_.findProduct(draft.output_product_id);
  if (!output) {
    throw NotFoundError("Unknown output product id " +
                        std::to_string(draft.output_product_id));
  }
  if (output->is_service) {
    throw ValidationError("Output product " + output->code +
                          " is a service");
  }

  for (std::size_t i = 0; i < draft.lines.size(); ++i) {
    const auto& line = draft.lines[i];
    const std::string where = "BOM line " + std::to_string(i + 1);
    if (line.material_id == 0) {
      throw ValidationError(where + ": material is required");
    }
    if (!master_data_.findProduct(line.material_id)) {
      throw NotFoundError(where + ": unknown material id " +
                          std::to_string(line.material_id));
    }
    if (!std::isfinite(line.qty_per_unit) || line.qty_per_unit <= 0.0) {
      throw ValidationError(where + ": quantity per unit must be positive");
    }
    if (!std::isfinite(line.scrap_rate_pct) || line.scrap_rate_pct < 0.0 ||
        line.scrap_rate_pct >= 100.0) {
      throw ValidationError(where + ": scrap rate must be in [0, 100)");
    }
  }

  BomHeader bom;
  bom.name = draft.name;
  bom.type = draft.type;
  bom.output_product_id = draft.output_product_id;
  bom.output_qty = draft.output_qty;
  bom.uom = draft.uom.empty() ? output->uom : draft.uom;
  bom.status = BomStatus::Draft;
  bom.version = 1;
  bom.effective_date = draft.effective_date;
  bom.notes = draft.notes;
  bom.created_by = actor;
  bom.updated_by = actor;
  bom.created_at_ms = time_provider_.now_ms();
  bom.lines = draft.lines;
  for (auto& line : bom.lines) {
    if (line.uom.empty()) {
      if (auto material = master_data_.findProduct(line.material_id)) {
        line.uom = material->uom;
      }
    }
  }

  {
    std::unique_lock lock(mutex_);
    bom.id = ids_.next_id();

    const int number = ++last_code_number_[bom.type];
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%03d", number);
    bom.code = std::string(codePrefix(bom.type)) + "-" + suffix;

    boms_.emplace(bom.id, bom);
  }

  std::cout << "[BomRegistry] Created " << bom.code << " (" << bom.name
            << ", " << bom.lines.size() << " lines)\n";
  return bom;
}

// -----------------------------------------------------------------------------
// updateStatus(): table-checked status change
// -----------------------------------------------------------------------------
BomHeader BomRegistry::updateStatus(domain::BomId bom_id,
                                    BomStatus status,
                                    const std::string& actor) {
  std::unique_lock lock(mutex_);
  auto it = boms_.find(bom_id);
  if (it == boms_.end()) {
    throw NotFoundError("Unknown BOM id " + std::to_string(bom_id));
  }

  BomHeader& bom = it->second;
  if (!canTransition(bom.status, status)) {
    throw InvalidStateTransitionError(
        "BOM " + bom.code + " cannot move from " +
        domain::toString(bom.status) + " to " + domain::toString(status));
  }
  if (status == BomStatus::Active && bom.lines.empty()) {
    throw ValidationError("BOM " + bom.code +
                          " has no materials and cannot be activated");
  }

  const BomStatus previous = bom.status;
  bom.status = status;
  bom.updated_by = actor;

  std::cout << "[BomRegistry] " << bom.code << " "
            << domain::toString(previous) << " -> "
            << domain::toString(status) << "\n";
  return bom;
}

bool BomRegistry::canTransition(BomStatus from, BomStatus to) {
  switch (from) {
    case BomStatus::Draft:
      return to == BomStatus::Active ||
             to == BomStatus::Inactive;

    case BomStatus::Active:
      return to == BomStatus::Inactive;

    case BomStatus::Inactive:
      return to == BomStatus::Active;
  }
  return false;
}

std::optional<BomHeader> BomRegistry::find(domain::BomId bom_id) const {
  std::shared_lock lock(mutex_);
  auto it = boms_.find(bom_id);
  if (it == boms_.end()) {
    return std::nullopt;
  }
  return it->second;
}

BomHeader BomRegistry::get(domain::BomId bom_id) const {
  auto bom = find(bom_id);
  if (!bom) {
    throw NotFoundError("Unknown BOM id " + std::to_string(bom_id));
  }
  return *bom;
}

std::vector<BomHeader> BomRegistry::list(const BomFilter& filter) const {
  std::vector<BomHeader> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, bom] : boms_) {
      if (filter.type && bom.type != *filter.type) continue;
      if (filter.status && bom.status != *filter.status) continue;
      result.push_back(bom);
    }
  }

  if (!filter.search.empty()) {
    result.erase(
        std::remove_if(result.begin(), result.end(),
                       [&](const BomHeader& bom) {
                         return !containsText(bom.code, filter.search) &&
                                !containsText(bom.name, filter.search) &&
                                !containsText(productName(
                                                  master_data_,
                                                  bom.output_product_id),
                                              filter.search);
                       }),
        result.end());
  }

  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.id > b.id; });
  return result;
}

std::vector<BomUsage> BomRegistry::whereUsed(
    domain::ProductId product_id) const {
  std::vector<BomUsage> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, bom] : boms_) {
      for (const auto& line : bom.lines) {
        if (line.material_id != product_id) {
          continue;
        }
        BomUsage usage;
        usage.bom_id = bom.id;
        usage.bom_code = bom.code;
        usage.bom_name = bom.name;
        usage.bom_status = bom.status;
        usage.output_product_id = bom.output_product_id;
        usage.qty_per_unit = line.qty_per_unit;
        usage.uom = line.uom;
        usage.material_type = line.material_type;
        result.push_back(std::move(usage));
      }
    }
  }

  for (auto& usage : result) {
    usage.output_product_name =
        productName(master_data_, usage.output_product_id);
  }
  std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
    if (a.bom_status != b.bom_status) {
      return a.bom_status == BomStatus::Active;
    }
    return a.bom_name < b.bom_name;
  });
  return result;
}

// -----------------------------------------------------------------------------
// materialUsageSummary(): aggregate lines of ACTIVE BOMs per material
// -----------------------------------------------------------------------------
std::vector<MaterialUsageRow> BomRegistry::materialUsageSummary() const {
  struct Accumulator {
    std::set<domain::BomId> boms;
    double total{0.0};
    std::set<BomType> types;
  };
  std::map<domain::ProductId, Accumulator> by_material;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, bom] : boms_) {
      if (bom.status != BomStatus::Active) {
        continue;
      }
      for (const auto& line : bom.lines) {
        auto& acc = by_material[line.material_id];
        acc.boms.insert(bom.id);
        acc.total += line.qty_per_unit;
        acc.types.insert(bom.type);
      }
    }
  }

  std::vector<MaterialUsageRow> rows;
  rows.reserve(by_material.size());
  for (const auto& [material_id, acc] : by_material) {
    MaterialUsageRow row;
    row.material_id = material_id;
    row.material_name = productName(master_data_, material_id);
    row.usage_count = static_cast<int>(acc.boms.size());
    row.total_qty_per_unit = acc.total;
    row.bom_types.assign(acc.types.begin(), acc.types.end());
    rows.push_back(std::move(row));
  }
  std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.usage_count != b.usage_count) {
      return a.usage_count > b.usage_count;
    }
    return a.total_qty_per_unit > b.total_qty_per_unit;
  });
  return rows;
}

const char* BomRegistry::codePrefix(BomType type) {
  switch (type) {
    case BomType::Kitting:   return "BOM-KIT";
    case BomType::Cutting:   return "BOM-CUT";
    case BomType::Repacking: return "BOM-REP";
  }
  return "BOM-UNK";
}

}  // namespace mfg
