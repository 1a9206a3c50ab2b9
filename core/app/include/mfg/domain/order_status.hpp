#pragma once

#include <optional>
#include <string>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus - manufacturing order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a manufacturing order can occupy.
//
// @details
// Orders are created directly in Confirmed (there is no draft stage at the
// order level). OrderStateMachine enforces the transition graph:
//
//   Confirmed ───> InProgress ───> Completed
//       │              │
//       ▼              ▼
//   Cancelled      Cancelled
//
// Confirmed -> InProgress happens on the first material issuance;
// InProgress -> InProgress on later issuances of remaining lines.
// Terminal states: Completed, Cancelled.
//
// Thread model:
//   Plain enum, a value type. Thread-safe to copy and compare.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Confirmed,   // created, requirements exploded, nothing issued yet
  InProgress,  // materials issued, awaiting completion
  Completed,   // receipt written, terminal
  Cancelled,   // abandoned, terminal
};

// Per-requirement-line issuance state.
enum class RequirementStatus {
  Pending,
  Issued,
};

enum class Priority {
  Low,
  Normal,
  High,
  Urgent,
};

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Confirmed:  return "CONFIRMED";
    case OrderStatus::InProgress: return "IN_PROGRESS";
    case OrderStatus::Completed:  return "COMPLETED";
    case OrderStatus::Cancelled:  return "CANCELLED";
  }
  return "UNKNOWN";
}

inline const char* toString(RequirementStatus status) {
  switch (status) {
    case RequirementStatus::Pending: return "PENDING";
    case RequirementStatus::Issued:  return "ISSUED";
  }
  return "UNKNOWN";
}

inline const char* toString(Priority priority) {
  switch (priority) {
    case Priority::Low:    return "LOW";
    case Priority::Normal: return "NORMAL";
    case Priority::High:   return "HIGH";
    case Priority::Urgent: return "URGENT";
  }
  return "UNKNOWN";
}

inline std::optional<OrderStatus> parseOrderStatus(const std::string& s) {
  if (s == "CONFIRMED") return OrderStatus::Confirmed;
  if (s == "IN_PROGRESS") return OrderStatus::InProgress;
  if (s == "COMPLETED") return OrderStatus::Completed;
  if (s == "CANCELLED") return OrderStatus::Cancelled;
  return std::nullopt;
}

inline std::optional<Priority> parsePriority(const std::string& s) {
  if (s == "LOW") return Priority::Low;
  if (s == "NORMAL") return Priority::Normal;
  if (s == "HIGH") return Priority::High;
  if (s == "URGENT") return Priority::Urgent;
  return std::nullopt;
}

}  // namespace domain
}  // namespace mfg
