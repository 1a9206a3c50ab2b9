#include "mfg/production/order_state_machine.hpp"
#include "mfg/errors/errors.hpp"

#include <string>

namespace mfg {

// -----------------------------------------------------------------------------
// canTransition(): the order lifecycle graph as a switch table
// -----------------------------------------------------------------------------
bool OrderStateMachine::canTransition(domain::OrderStatus from,
                                      domain::OrderStatus to) {
  using S = domain::OrderStatus;

  switch (from) {
    case S::Confirmed:
      return to == S::InProgress ||
             to == S::Cancelled;

    case S::InProgress:
      return to == S::InProgress ||
             to == S::Completed ||
             to == S::Cancelled;

    case S::Completed:
    case S::Cancelled:
      return false;
  }

  return false;
}

bool OrderStateMachine::isTerminal(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  return status == S::Completed ||
         status == S::Cancelled;
}

void OrderStateMachine::requireTransition(
    const domain::ManufacturingOrder& order,
    domain::OrderStatus to,
    const char* command) {
  if (!canTransition(order.status, to)) {
    throw InvalidStateTransitionError(
        std::string(command) + " is not allowed for order " + order.order_no +
        " in status " + domain::toString(order.status) + " (would move to " +
        domain::toString(to) + ")");
  }
}

}  // namespace mfg
