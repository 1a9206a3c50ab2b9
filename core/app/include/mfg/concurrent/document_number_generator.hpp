#pragma once

#include "mfg/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_set>

namespace mfg {

// -----------------------------------------------------------------------------
// DocumentNumberGenerator - numbering authority for orders, issues, receipts
// -----------------------------------------------------------------------------
//
// @brief  Issues human-readable document numbers of the form
//         PREFIX-YYYYMMDDHHMMSS-NNNN and UUID group ids.
//
// @details
// A timestamp alone repeats when two commands land in the same second, so a
// four-digit running sequence is appended and every number handed out is
// remembered. If a candidate was already issued (the sequence wrapped within
// one second) the generator moves on to the next sequence value. After
// 10000 consecutive collisions there is no free number left for that second
// and ConcurrencyConflictError is thrown; callers retry on a later tick.
//
// Group ids (UUID v4 text) tie together every row one issuance or completion
// writes. They come from a mt19937_64 seeded from std::random_device and
// guarded by the same mutex as the issued set.
//
// Thread model:
//   next() and newGroupId() are safe to call concurrently from any thread.
//
// Ownership:
//   Owned by ManufacturingEngine (or a test fixture) and injected by
//   reference into ManufacturingOrderService.
// -----------------------------------------------------------------------------
class DocumentNumberGenerator {
 public:
  explicit DocumentNumberGenerator(const ITimeProvider& time_provider);

  DocumentNumberGenerator(const DocumentNumberGenerator&) = delete;
  DocumentNumberGenerator& operator=(const DocumentNumberGenerator&) = delete;

  // Returns a number never returned before by this instance.
  std::string next(const std::string& prefix);

  std::string newGroupId();

  // Number of document numbers issued so far (all prefixes).
  std::size_t issuedCount() const;

 private:
  static std::string formatTimestamp(std::int64_t epoch_ms);

  const ITimeProvider& time_provider_;
  std::atomic<std::uint32_t> sequence_{0};

  mutable std::mutex mutex_;
  std::unordered_set<std::string> issued_;
  std::mt19937_64 rng_;
};

}  // namespace mfg
