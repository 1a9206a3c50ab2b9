#pragma once

#include "mfg/domain/identifiers.hpp"
#include "mfg/time/calendar_date.hpp"

#include <optional>
#include <string>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// GenealogyLink - consumed lot -> output order edge
// -----------------------------------------------------------------------------
// One link per consumption written by an issuance. The batch number and
// expiry of the source lot are copied so traceability queries do not depend
// on the lot row surviving in any particular shape.
// -----------------------------------------------------------------------------
struct GenealogyLink {
  OrderId output_order_id{};
  LotId consumed_lot_id{};
  ProductId material_id{};
  std::string source_batch_no;
  std::optional<CalendarDate> source_expiry;
  double quantity{0.0};
  std::string group_id;
};

}  // namespace domain
}  // namespace mfg
