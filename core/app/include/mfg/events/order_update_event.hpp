#pragma once

#include "mfg/domain/manufacturing_order.hpp"
#include "mfg/domain/order_status.hpp"
#include "mfg/events/event_types.hpp"

#include <optional>

namespace mfg {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by ManufacturingOrderService after every committed
//         change of an order: creation, first issuance, completion,
//         cancellation.
//
// @details
// `order` is a copy taken after the commit. `previous_status` is empty for
// a newly created order, otherwise the status before the command ran.
// Subscribers (IpcServer telemetry, tests) never see an event for a command
// that rolled back: publish happens strictly after commit() returned.
//
// Thread model:
//   Published on the thread that ran the command. Plain data; safe to copy
//   into the IPC telemetry queue.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::ManufacturingOrder order;                   // Snapshot after commit
  std::optional<domain::OrderStatus> previous_status;  // None on creation
  TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace mfg
