#pragma once

#include "mfg/domain/identifiers.hpp"

#include <string>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// Product / Warehouse - external master data, read-only to the engine
// -----------------------------------------------------------------------------
// Responsibility: The subset of product and warehouse attributes the engine
// validates against. Maintained by an outside system and served through
// IMasterDataRegistry.
// -----------------------------------------------------------------------------
struct Product {
  ProductId id{};
  std::string code;        // e.g. "PT-0042"
  std::string name;
  std::string uom;         // unit of measure, e.g. "KG", "PCS"
  bool is_service{false};  // services carry no stock
  bool approved{true};     // unapproved products cannot be received
};

struct Warehouse {
  WarehouseId id{};
  std::string name;
  EntityId entity_id{};  // owning company; stamped onto orders
  bool active{true};
};

}  // namespace domain
}  // namespace mfg
