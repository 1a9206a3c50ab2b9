#include "mfg/time/simulation_time_provider.hpp"
#include "mfg/time/calendar_date.hpp"

namespace mfg {

namespace {
constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;
}  // namespace

SimulationTimeProvider::SimulationTimeProvider(const CalendarDate& date)
    : current_time_ms_(date.startOfDayMs()) {}

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void SimulationTimeProvider::set_date(const CalendarDate& date) {
  current_time_ms_.store(date.startOfDayMs());
}

void SimulationTimeProvider::advance_days(int days) {
  current_time_ms_.fetch_add(static_cast<std::int64_t>(days) * kMsPerDay);
}

}  // namespace mfg
