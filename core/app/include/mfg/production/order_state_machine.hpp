#pragma once

#include "mfg/domain/manufacturing_order.hpp"
#include "mfg/domain/order_status.hpp"

namespace mfg {

// -----------------------------------------------------------------------------
// OrderStateMachine - transition table for manufacturing orders
// -----------------------------------------------------------------------------
//
// @brief  Single authority on which status changes an order may make.
//         Every mutating command handler calls requireTransition() before it
//         stages anything.
//
// @details
// Valid transitions (anything else is illegal):
//
//   Confirmed  → InProgress  (first issuance)
//   Confirmed  → Cancelled
//   InProgress → InProgress  (issuance of lines still pending)
//   InProgress → Completed
//   InProgress → Cancelled
//   Completed  → (none, terminal)
//   Cancelled  → (none, terminal)
//
// Thread model: stateless, static functions only.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  static bool canTransition(domain::OrderStatus from, domain::OrderStatus to);

  static bool isTerminal(domain::OrderStatus status);

  // Throws InvalidStateTransitionError naming the order, the command and
  // both statuses when the transition is not in the table.
  static void requireTransition(const domain::ManufacturingOrder& order,
                                domain::OrderStatus to,
                                const char* command);
};

}  // namespace mfg
