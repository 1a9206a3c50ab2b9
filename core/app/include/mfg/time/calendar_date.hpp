#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mfg {

// -----------------------------------------------------------------------------
// CalendarDate - a day on the proleptic Gregorian calendar (UTC)
// -----------------------------------------------------------------------------
//
// @brief  Value type for order dates, scheduled dates, completion dates and
//         lot expiry dates. Stored as days since 1970-01-01.
//
// @details
// The ledger and the FEFO ordering only ever compare dates and add day
// offsets ("expires within 7 days"), so a single signed day count is enough.
// Conversions to and from year/month/day use the days_from_civil /
// civil_from_days algorithms, valid for the whole int32 range.
//
// Text form is ISO-8601 "YYYY-MM-DD", used in JSON commands, telemetry and
// the seed file.
//
// Thread model: immutable value type, safe to copy between threads.
// -----------------------------------------------------------------------------
class CalendarDate {
 public:
  CalendarDate() = default;

  static CalendarDate fromDays(std::int32_t days_since_epoch);

  // Throws ValidationError if the triple is not a real calendar day.
  static CalendarDate fromYmd(int year, unsigned month, unsigned day);

  // Parses "YYYY-MM-DD". Throws ValidationError on malformed text.
  static CalendarDate parse(const std::string& iso);

  // Date (UTC) containing the given epoch-millisecond instant.
  static CalendarDate fromEpochMs(std::int64_t epoch_ms);

  std::int32_t daysSinceEpoch() const { return days_; }
  int year() const;
  unsigned month() const;
  unsigned day() const;

  CalendarDate addDays(std::int32_t days) const {
    return fromDays(days_ + days);
  }

  // Milliseconds since epoch at 00:00:00 UTC of this date.
  std::int64_t startOfDayMs() const;

  std::string toString() const;

  friend bool operator==(CalendarDate a, CalendarDate b) {
    return a.days_ == b.days_;
  }
  friend bool operator!=(CalendarDate a, CalendarDate b) {
    return a.days_ != b.days_;
  }
  friend bool operator<(CalendarDate a, CalendarDate b) {
    return a.days_ < b.days_;
  }
  friend bool operator<=(CalendarDate a, CalendarDate b) {
    return a.days_ <= b.days_;
  }
  friend bool operator>(CalendarDate a, CalendarDate b) {
    return a.days_ > b.days_;
  }
  friend bool operator>=(CalendarDate a, CalendarDate b) {
    return a.days_ >= b.days_;
  }

 private:
  explicit CalendarDate(std::int32_t days) : days_(days) {}

  std::int32_t days_{0};
};

// Number of days from `from` to `to` (negative when `to` is earlier).
inline std::int32_t daysBetween(CalendarDate from, CalendarDate to) {
  return to.daysSinceEpoch() - from.daysSinceEpoch();
}

// "" for an absent date, ISO text otherwise. Used by JSON formatters.
inline std::string optionalDateToString(const std::optional<CalendarDate>& d) {
  return d ? d->toString() : std::string{};
}

}  // namespace mfg
