#pragma once

#include "mfg/domain/identifiers.hpp"
#include "mfg/time/calendar_date.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mfg {
namespace domain {

// Quality is a flag recorded at completion; there is no inspection workflow.
enum class QualityStatus {
  Pending,
  Passed,
  Failed,
};

inline const char* toString(QualityStatus status) {
  switch (status) {
    case QualityStatus::Pending: return "PENDING";
    case QualityStatus::Passed:  return "PASSED";
    case QualityStatus::Failed:  return "FAILED";
  }
  return "UNKNOWN";
}

inline std::optional<QualityStatus> parseQualityStatus(const std::string& s) {
  if (s == "PENDING") return QualityStatus::Pending;
  if (s == "PASSED") return QualityStatus::Passed;
  if (s == "FAILED") return QualityStatus::Failed;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// ProductionReceipt
// -----------------------------------------------------------------------------
// Written once when an order completes. The matching ProductionIn ledger row
// shares batch_no, group_id and expiry with it.
// -----------------------------------------------------------------------------
struct ProductionReceipt {
  ReceiptId id{};
  std::string receipt_no;  // PR-YYYYMMDDHHMMSS-NNNN
  OrderId order_id{};
  ProductId product_id{};
  double quantity{0.0};
  std::string uom;
  std::string batch_no;
  WarehouseId warehouse_id{};
  std::optional<CalendarDate> expiry;
  QualityStatus quality_status{QualityStatus::Pending};
  std::string notes;
  std::string group_id;
  std::string created_by;
  std::int64_t received_at_ms{0};
};

}  // namespace domain
}  // namespace mfg
