#include "mfg/time/calendar_date.hpp"
#include "mfg/errors/errors.hpp"

#include <cstdio>

namespace mfg {

namespace {

constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

struct Civil {
  int year;
  unsigned month;
  unsigned day;
};

// days_from_civil: shift the year so it starts on March 1st, which puts the
// leap day at the end of the 400-year era and makes month lengths regular.
std::int32_t daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);          // [0, 399]
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;  // [0, 365]
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;         // [0, 146096]
  return era * 146097 + static_cast<int>(doe) - 719468;
}

Civil civilFromDays(std::int32_t z) {
  z += 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return Civil{y + (m <= 2 ? 1 : 0), m, d};
}

bool isLeap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned lastDayOfMonth(int y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeap(y)) ? 29u : kDays[m - 1];
}

}  // namespace

CalendarDate CalendarDate::fromDays(std::int32_t days_since_epoch) {
  return CalendarDate(days_since_epoch);
}

CalendarDate CalendarDate::fromYmd(int year, unsigned month, unsigned day) {
  if (month < 1 || month > 12 || day < 1 ||
      day > lastDayOfMonth(year, month)) {
    throw ValidationError("Invalid calendar date: " + std::to_string(year) +
                          "-" + std::to_string(month) + "-" +
                          std::to_string(day));
  }
  return CalendarDate(daysFromCivil(year, month, day));
}

// -----------------------------------------------------------------------------
// parse(): strict "YYYY-MM-DD"
// -----------------------------------------------------------------------------
CalendarDate CalendarDate::parse(const std::string& iso) {
  if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
    throw ValidationError("Malformed date (expected YYYY-MM-DD): '" + iso +
                          "'");
  }
  for (std::size_t i = 0; i < iso.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (iso[i] < '0' || iso[i] > '9') {
      throw ValidationError("Malformed date (expected YYYY-MM-DD): '" + iso +
                            "'");
    }
  }

  const int year = std::stoi(iso.substr(0, 4));
  const auto month = static_cast<unsigned>(std::stoi(iso.substr(5, 2)));
  const auto day = static_cast<unsigned>(std::stoi(iso.substr(8, 2)));
  return fromYmd(year, month, day);
}

CalendarDate CalendarDate::fromEpochMs(std::int64_t epoch_ms) {
  // Floor division so instants before 1970 land on the previous day.
  std::int64_t days = epoch_ms / kMsPerDay;
  if (epoch_ms % kMsPerDay < 0) {
    --days;
  }
  return CalendarDate(static_cast<std::int32_t>(days));
}

int CalendarDate::year() const { return civilFromDays(days_).year; }

unsigned CalendarDate::month() const { return civilFromDays(days_).month; }

unsigned CalendarDate::day() const { return civilFromDays(days_).day; }

std::int64_t CalendarDate::startOfDayMs() const {
  return static_cast<std::int64_t>(days_) * kMsPerDay;
}

std::string CalendarDate::toString() const {
  const Civil c = civilFromDays(days_);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.year, c.month, c.day);
  return buf;
}

}  // namespace mfg
