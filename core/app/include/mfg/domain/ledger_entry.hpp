#pragma once

#include "mfg/domain/identifiers.hpp"
#include "mfg/time/calendar_date.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// MovementType - kind of ledger row
// -----------------------------------------------------------------------------
// StockIn and ProductionIn rows are lots: they carry a `remain` that FEFO
// consumes. ProductionOut rows record one consumption against a lot and have
// a negative quantity and zero remain.
// -----------------------------------------------------------------------------
enum class MovementType {
  StockIn,        // opening stock / purchase receipt
  ProductionIn,   // output of a completed order
  ProductionOut,  // material consumed by an issuance
};

inline bool isInbound(MovementType type) {
  return type != MovementType::ProductionOut;
}

inline const char* toString(MovementType type) {
  switch (type) {
    case MovementType::StockIn:       return "STOCK_IN";
    case MovementType::ProductionIn:  return "PRODUCTION_IN";
    case MovementType::ProductionOut: return "PRODUCTION_OUT";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// LedgerEntry - one append-only row of the inventory ledger
// -----------------------------------------------------------------------------
//
// @details
// Rows are never removed. The only fields that change after the row is
// committed are `remain` (non-increasing, never below zero) and `version`
// (bumped with each decrement so concurrent planners can detect that the lot
// moved underneath them).
//
// Sign convention:
//   quantity > 0 for inbound rows, quantity < 0 for ProductionOut rows, so
//   the sum of `quantity` over every row of a product/warehouse equals the
//   sum of `remain` over its lots.
// -----------------------------------------------------------------------------
struct LedgerEntry {
  LotId id{};
  MovementType movement{MovementType::StockIn};
  ProductId product_id{};
  WarehouseId warehouse_id{};
  std::string batch_no;
  double quantity{0.0};
  double remain{0.0};
  std::string uom;
  std::optional<CalendarDate> expiry;
  LotId source_lot_id{};  // ProductionOut only: the lot consumed
  std::string group_id;   // ties together the rows of one event
  std::string source_ref; // document number that wrote the row
  std::string created_by;
  std::int64_t created_at_ms{0};
  bool deleted{false};
  std::uint64_t version{1};
};

// -----------------------------------------------------------------------------
// fefoLess - First-Expired-First-Out ordering of lots
// -----------------------------------------------------------------------------
// (expiry asc, lots without expiry last, batch_no asc, id asc). The trailing
// id makes the order total, so two planners over the same snapshot always
// walk the lots identically.
// -----------------------------------------------------------------------------
inline bool fefoLess(const LedgerEntry& a, const LedgerEntry& b) {
  if (a.expiry.has_value() != b.expiry.has_value()) {
    return a.expiry.has_value();
  }
  if (a.expiry && *a.expiry != *b.expiry) {
    return *a.expiry < *b.expiry;
  }
  if (a.batch_no != b.batch_no) {
    return a.batch_no < b.batch_no;
  }
  return a.id < b.id;
}

// -----------------------------------------------------------------------------
// ExpiryStatus - shelf-life classification relative to "today"
// -----------------------------------------------------------------------------
enum class ExpiryStatus {
  Expired,   // expiry < today
  Critical,  // expiry <= today + critical_days
  Warning,   // expiry <= today + warning_days
  Ok,        // later, or no expiry at all
};

inline const char* toString(ExpiryStatus status) {
  switch (status) {
    case ExpiryStatus::Expired:  return "EXPIRED";
    case ExpiryStatus::Critical: return "CRITICAL";
    case ExpiryStatus::Warning:  return "WARNING";
    case ExpiryStatus::Ok:       return "OK";
  }
  return "UNKNOWN";
}

inline ExpiryStatus classifyExpiry(const std::optional<CalendarDate>& expiry,
                                   CalendarDate today,
                                   int critical_days,
                                   int warning_days) {
  if (!expiry) {
    return ExpiryStatus::Ok;
  }
  if (*expiry < today) {
    return ExpiryStatus::Expired;
  }
  if (*expiry <= today.addDays(critical_days)) {
    return ExpiryStatus::Critical;
  }
  if (*expiry <= today.addDays(warning_days)) {
    return ExpiryStatus::Warning;
  }
  return ExpiryStatus::Ok;
}

}  // namespace domain
}  // namespace mfg
