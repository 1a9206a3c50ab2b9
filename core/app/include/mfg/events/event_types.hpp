#pragma once

#include "mfg/domain/bom.hpp"
#include "mfg/domain/ledger_entry.hpp"

#include <cstdint>
#include <string>

namespace mfg {

// -----------------------------------------------------------------------------
// Timestamps
// -----------------------------------------------------------------------------
// Events carry epoch milliseconds taken from the injected ITimeProvider, not
// std::chrono::system_clock, so tests running on a SimulationTimeProvider see
// the same instants the stores recorded.
// -----------------------------------------------------------------------------
using TimestampMs = std::int64_t;

// -----------------------------------------------------------------------------
// StockReceivedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces a new STOCK_IN lot (opening stock, purchase
// receipt). Published by ManufacturingEngine after the ledger accepted it.
// -----------------------------------------------------------------------------
struct StockReceivedEvent {
  domain::LedgerEntry lot;  // Snapshot of the new lot
  TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// BomStatusChangedEvent
// -----------------------------------------------------------------------------
// Responsibility: A recipe was activated or retired. Order entry screens
// listen to refresh the list of BOMs they offer.
// -----------------------------------------------------------------------------
struct BomStatusChangedEvent {
  domain::BomId bom_id{};
  std::string bom_code;
  domain::BomStatus previous_status{domain::BomStatus::Draft};
  domain::BomStatus status{domain::BomStatus::Draft};
  TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace mfg
