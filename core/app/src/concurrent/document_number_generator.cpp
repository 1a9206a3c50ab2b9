#include "mfg/concurrent/document_number_generator.hpp"
#include "mfg/errors/errors.hpp"
#include "mfg/time/calendar_date.hpp"

#include <cstdio>

namespace mfg {

namespace {
constexpr std::uint32_t kSequenceSpace = 10000;
constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;
}  // namespace

DocumentNumberGenerator::DocumentNumberGenerator(
    const ITimeProvider& time_provider)
    : time_provider_(time_provider), rng_(std::random_device{}()) {}

std::string DocumentNumberGenerator::next(const std::string& prefix) {
  const std::string stamp = formatTimestamp(time_provider_.now_ms());

  for (std::uint32_t attempt = 0; attempt < kSequenceSpace; ++attempt) {
    const std::uint32_t seq =
        sequence_.fetch_add(1, std::memory_order_relaxed) % kSequenceSpace;

    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "%04u", seq);
    std::string candidate = prefix + "-" + stamp + "-" + suffix;

    std::lock_guard lock(mutex_);
    if (issued_.insert(candidate).second) {
      return candidate;
    }
  }

  throw ConcurrencyConflictError("No free document number for prefix " +
                                 prefix + " at " + stamp);
}

std::string DocumentNumberGenerator::newGroupId() {
  std::uint64_t hi;
  std::uint64_t lo;
  {
    std::lock_guard lock(mutex_);
    hi = rng_();
    lo = rng_();
  }

  // RFC 4122 version 4, variant 10xx.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return buf;
}

std::size_t DocumentNumberGenerator::issuedCount() const {
  std::lock_guard lock(mutex_);
  return issued_.size();
}

std::string DocumentNumberGenerator::formatTimestamp(std::int64_t epoch_ms) {
  const CalendarDate date = CalendarDate::fromEpochMs(epoch_ms);
  std::int64_t ms_of_day = epoch_ms - date.startOfDayMs();
  if (ms_of_day < 0 || ms_of_day >= kMsPerDay) {
    ms_of_day = 0;
  }
  const auto secs = static_cast<unsigned>(ms_of_day / 1000);

  char buf[20];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u%02u%02u%02u", date.year(),
                date.month(), date.day(), secs / 3600, (secs / 60) % 60,
                secs % 60);
  return buf;
}

}  // namespace mfg
