#pragma once

#include "mfg/domain/production_receipt.hpp"
#include "mfg/events/event_types.hpp"

#include <string>

namespace mfg {

// -----------------------------------------------------------------------------
// ProductionCompletedEvent
// -----------------------------------------------------------------------------
// Responsibility: A completed order's receipt, which also describes the new
// PRODUCTION_IN lot (same batch, quantity and expiry).
// -----------------------------------------------------------------------------
struct ProductionCompletedEvent {
  domain::ProductionReceipt receipt;
  std::string order_no;
  domain::LotId lot_id{};
  TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace mfg
