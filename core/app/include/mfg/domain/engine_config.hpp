#pragma once

#include <string>

namespace mfg {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig - engine-wide tunables
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct holding every configurable value of the engine.
//
// @details
// Loaded once at startup by ConfigLoader from a JSON file (missing keys keep
// the defaults below) and copied by value into the components that need it.
// No component re-reads configuration after construction.
//
// Thread model:
//   Value semantics. Each component owns its copy; there is no shared
//   mutable configuration state.
// -----------------------------------------------------------------------------
struct EngineConfig {
  /// How many times a command body is re-run after an optimistic version
  /// check fails at commit, before ConcurrencyConflictError is surfaced.
  int max_allocation_retries{3};

  /// When false, FEFO skips lots whose expiry date is before today.
  bool allow_expired_issue{true};

  /// Expiry classification thresholds, in days from today (inclusive).
  int expiry_critical_days{7};
  int expiry_warning_days{30};

  /// createOrder rejects BOMs that are not ACTIVE when set.
  bool require_active_bom{true};

  /// Document number prefixes: PREFIX-YYYYMMDDHHMMSS-NNNN.
  std::string order_prefix{"MO"};
  std::string issue_prefix{"MI"};
  std::string receipt_prefix{"PR"};

  /// ZeroMQ endpoints. Either one empty disables the IPC server.
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5556"};
};

}  // namespace domain
}  // namespace mfg
