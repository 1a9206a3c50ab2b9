#pragma once

#include "mfg/domain/identifiers.hpp"
#include "mfg/time/calendar_date.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// BomType - the three recipe families
// -----------------------------------------------------------------------------
// KITTING assembles several materials into one kit and inherits the earliest
// material expiry. CUTTING and REPACKING transform a material; the output
// expiry is supplied by the operator, if at all.
// -----------------------------------------------------------------------------
enum class BomType {
  Kitting,
  Cutting,
  Repacking,
};

// -----------------------------------------------------------------------------
// BomStatus - recipe lifecycle
// -----------------------------------------------------------------------------
//
//   Draft ──> Active <──> Inactive
//     │                      ▲
//     └──────────────────────┘
//
// Only ACTIVE BOMs can be exploded into new orders (when the policy demands
// it). BomRegistry::canTransition() holds the table.
// -----------------------------------------------------------------------------
enum class BomStatus {
  Draft,
  Active,
  Inactive,
};

enum class MaterialType {
  RawMaterial,
  Packaging,
  Consumable,
};

// -----------------------------------------------------------------------------
// BomLine - one input material of a recipe
// -----------------------------------------------------------------------------
struct BomLine {
  ProductId material_id{};
  MaterialType material_type{MaterialType::RawMaterial};
  double qty_per_unit{0.0};    // per unit of output
  std::string uom;
  double scrap_rate_pct{0.0};  // expected waste, 0 <= x < 100
};

// -----------------------------------------------------------------------------
// BomHeader - a single-level recipe with its lines
// -----------------------------------------------------------------------------
struct BomHeader {
  BomId id{};
  std::string code;  // BOM-KIT-001
  std::string name;
  BomType type{BomType::Kitting};
  ProductId output_product_id{};
  double output_qty{1.0};
  std::string uom;
  BomStatus status{BomStatus::Draft};
  int version{1};
  std::optional<CalendarDate> effective_date;
  std::string notes;
  std::string created_by;
  std::string updated_by;
  std::int64_t created_at_ms{0};
  std::vector<BomLine> lines;
};

inline const char* toString(BomType type) {
  switch (type) {
    case BomType::Kitting:   return "KITTING";
    case BomType::Cutting:   return "CUTTING";
    case BomType::Repacking: return "REPACKING";
  }
  return "UNKNOWN";
}

inline const char* toString(BomStatus status) {
  switch (status) {
    case BomStatus::Draft:    return "DRAFT";
    case BomStatus::Active:   return "ACTIVE";
    case BomStatus::Inactive: return "INACTIVE";
  }
  return "UNKNOWN";
}

inline const char* toString(MaterialType type) {
  switch (type) {
    case MaterialType::RawMaterial: return "RAW_MATERIAL";
    case MaterialType::Packaging:   return "PACKAGING";
    case MaterialType::Consumable:  return "CONSUMABLE";
  }
  return "UNKNOWN";
}

inline std::optional<BomType> parseBomType(const std::string& s) {
  if (s == "KITTING") return BomType::Kitting;
  if (s == "CUTTING") return BomType::Cutting;
  if (s == "REPACKING") return BomType::Repacking;
  return std::nullopt;
}

inline std::optional<BomStatus> parseBomStatus(const std::string& s) {
  if (s == "DRAFT") return BomStatus::Draft;
  if (s == "ACTIVE") return BomStatus::Active;
  if (s == "INACTIVE") return BomStatus::Inactive;
  return std::nullopt;
}

inline std::optional<MaterialType> parseMaterialType(const std::string& s) {
  if (s == "RAW_MATERIAL") return MaterialType::RawMaterial;
  if (s == "PACKAGING") return MaterialType::Packaging;
  if (s == "CONSUMABLE") return MaterialType::Consumable;
  return std::nullopt;
}

}  // namespace domain
}  // namespace mfg
