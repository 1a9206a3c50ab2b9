#pragma once

#include "mfg/time/i_time_provider.hpp"

namespace mfg {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the mfg_engine executable. Tests use SimulationTimeProvider so that
// expiry classification and order dates are deterministic.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace mfg
