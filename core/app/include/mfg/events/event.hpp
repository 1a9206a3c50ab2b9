#pragma once

#include "mfg/events/event_types.hpp"
#include "mfg/events/materials_issued_event.hpp"
#include "mfg/events/order_update_event.hpp"
#include "mfg/events/production_completed_event.hpp"

#include <variant>

namespace mfg {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by the EventBus.
// A closed std::variant keeps events as values (no heap, no base-class
// pointers) and lets subscribers dispatch with std::get_if or std::visit.
// Adding an event kind means adding it here and to IpcServer's formatter.
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderUpdateEvent,
    MaterialsIssuedEvent,
    ProductionCompletedEvent,
    StockReceivedEvent,
    BomStatusChangedEvent>;

}  // namespace mfg
