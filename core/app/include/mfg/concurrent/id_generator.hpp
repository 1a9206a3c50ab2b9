#pragma once

#include <atomic>
#include <cstdint>

namespace mfg {

// -----------------------------------------------------------------------------
// IdGenerator - thread-safe, monotonically increasing row id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique row ids via an atomic counter, one generator per
//         table (orders, requirements, lots, issues, ...).
//
// @details
// Starts at 1; id 0 is the "unset" sentinel. Ids are drawn when a row is
// staged in a UnitOfWork, not when it is committed, so a rolled-back command
// leaves a gap in the sequence, the same way a database sequence behaves.
// Gaps are harmless; reuse would not be.
//
// std::memory_order_relaxed is sufficient: the only requirement is that each
// call returns a distinct value.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
//
// Ownership:
//   Held as a value member by the store that owns the table.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  // Non-copyable, non-movable: copying a generator would create two sources
  // producing duplicate ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace mfg
