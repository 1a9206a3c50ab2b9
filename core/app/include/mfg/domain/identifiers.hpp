#pragma once

#include <cstdint>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// Responsibility: Row identifiers for every entity the engine stores.
// Why strong aliases (using OrderId = std::uint64_t):
// - Function signatures document which table an id belongs to
//   (LotId vs OrderId) without the ceremony of wrapper classes.
// - Still plain integers: cheap to copy, comparable, hashable.
// 0 is reserved as the "unset" sentinel; generators start at 1.
// -----------------------------------------------------------------------------
using ProductId = std::uint64_t;
using WarehouseId = std::uint64_t;
using EntityId = std::uint64_t;
using BomId = std::uint64_t;
using OrderId = std::uint64_t;
using RequirementId = std::uint64_t;
using LotId = std::uint64_t;
using IssueId = std::uint64_t;
using IssueDetailId = std::uint64_t;
using ReceiptId = std::uint64_t;

// Quantities are doubles (scrap rates produce fractional requirements).
// Two quantities closer than this are treated as equal; a remain below it
// counts as exhausted.
constexpr double kQuantityEpsilon = 1e-9;

}  // namespace domain
}  // namespace mfg
