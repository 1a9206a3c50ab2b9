#pragma once

#include "mfg/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace mfg {

class CalendarDate;

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally-driven clock for tests and replays
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// Expiry classification is relative to today: a lot expiring 2025-01-10 is
// EXPIRED on 2025-01-11 and CRITICAL on 2025-01-05. Tests pin the clock with
// set_date() so those assertions hold whenever the suite runs.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_. Command handlers running on
//   several test threads read it concurrently while the fixture may advance
//   it between steps; an atomic gives visibility without a mutex.
//
// Thread model:
//   - advance_time() / set_date() / advance_days(): intended single writer.
//   - now_ms(): any number of concurrent readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Starts the clock at midnight UTC of the given date.
  explicit SimulationTimeProvider(const CalendarDate& date);

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given timestamp.
  //
  // @details
  // Monotonicity is not enforced; tests occasionally rewind to check the
  // classification on an earlier day.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Sets the clock to midnight UTC of the given date.
  void set_date(const CalendarDate& date);

  // Moves the clock forward (or backward, for negative values) by whole days.
  void advance_days(int days);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace mfg
