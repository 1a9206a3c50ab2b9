#pragma once

#include <cstdint>

namespace mfg {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Order dates, completion dates, ledger timestamps and the expiry
// classification (EXPIRED / CRITICAL / WARNING / OK) all depend on "today".
// If components read the system clock directly, a test that seeds a lot
// expiring on 2025-01-10 would change behaviour depending on the day it runs.
//
// ITimeProvider solves this with dependency injection:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the test or the replay
//                              harness.
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp; CalendarDate::fromEpochMs() turns it into a date.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Command handlers run on whichever thread calls them (IPC thread, test
//   threads), all reading the same provider.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace mfg
