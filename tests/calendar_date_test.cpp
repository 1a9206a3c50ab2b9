// =============================================================================
// calendar_date_test.cpp
// =============================================================================
// Unit tests for mfg::CalendarDate and the expiry classification built on it.
// =============================================================================

#include "mfg/domain/ledger_entry.hpp"
#include "mfg/errors/errors.hpp"
#include "mfg/time/calendar_date.hpp"
#include "mfg/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

using mfg::CalendarDate;
using mfg::domain::ExpiryStatus;

TEST(CalendarDateTest, ParsesAndFormatsIsoDates) {
  const auto d = CalendarDate::parse("2025-02-15");
  EXPECT_EQ(d.year(), 2025);
  EXPECT_EQ(d.month(), 2u);
  EXPECT_EQ(d.day(), 15u);
  EXPECT_EQ(d.toString(), "2025-02-15");
}

TEST(CalendarDateTest, EpochIsDayZero) {
  EXPECT_EQ(CalendarDate::parse("1970-01-01").daysSinceEpoch(), 0);
  EXPECT_EQ(CalendarDate::fromDays(0).toString(), "1970-01-01");
  EXPECT_EQ(CalendarDate::fromDays(-1).toString(), "1969-12-31");
}

TEST(CalendarDateTest, LeapDaysFollowGregorianRules) {
  EXPECT_NO_THROW(CalendarDate::fromYmd(2024, 2, 29));
  EXPECT_NO_THROW(CalendarDate::fromYmd(2000, 2, 29));
  EXPECT_THROW(CalendarDate::fromYmd(2025, 2, 29), mfg::ValidationError);
  EXPECT_THROW(CalendarDate::fromYmd(1900, 2, 29), mfg::ValidationError);
}

TEST(CalendarDateTest, RejectsMalformedText) {
  EXPECT_THROW(CalendarDate::parse(""), mfg::ValidationError);
  EXPECT_THROW(CalendarDate::parse("2025-1-5"), mfg::ValidationError);
  EXPECT_THROW(CalendarDate::parse("2025/01/05"), mfg::ValidationError);
  EXPECT_THROW(CalendarDate::parse("2025-13-01"), mfg::ValidationError);
  EXPECT_THROW(CalendarDate::parse("2025-04-31"), mfg::ValidationError);
  EXPECT_THROW(CalendarDate::parse("20a5-01-01"), mfg::ValidationError);
}

TEST(CalendarDateTest, AddDaysCrossesMonthAndYearBoundaries) {
  EXPECT_EQ(CalendarDate::parse("2024-12-25").addDays(7).toString(),
            "2025-01-01");
  EXPECT_EQ(CalendarDate::parse("2024-02-28").addDays(1).toString(),
            "2024-02-29");
  EXPECT_EQ(CalendarDate::parse("2025-03-01").addDays(-1).toString(),
            "2025-02-28");
  EXPECT_EQ(mfg::daysBetween(CalendarDate::parse("2025-01-10"),
                             CalendarDate::parse("2025-02-15")),
            36);
}

TEST(CalendarDateTest, EpochMillisecondsMapToUtcDay) {
  const auto d = CalendarDate::parse("2025-01-10");
  EXPECT_EQ(CalendarDate::fromEpochMs(d.startOfDayMs()), d);
  EXPECT_EQ(CalendarDate::fromEpochMs(d.startOfDayMs() + 86'399'999), d);
  EXPECT_EQ(CalendarDate::fromEpochMs(d.startOfDayMs() + 86'400'000),
            d.addDays(1));
  EXPECT_EQ(CalendarDate::fromEpochMs(-1).toString(), "1969-12-31");
}

TEST(CalendarDateTest, SimulationClockMovesByWholeDays) {
  mfg::SimulationTimeProvider clock(CalendarDate::parse("2025-01-10"));
  EXPECT_EQ(CalendarDate::fromEpochMs(clock.now_ms()).toString(),
            "2025-01-10");
  clock.advance_days(30);
  EXPECT_EQ(CalendarDate::fromEpochMs(clock.now_ms()).toString(),
            "2025-02-09");
  clock.set_date(CalendarDate::parse("2024-12-31"));
  EXPECT_EQ(CalendarDate::fromEpochMs(clock.now_ms()).toString(),
            "2024-12-31");
}

// -----------------------------------------------------------------------------
// Expiry classification: EXPIRED < today <= CRITICAL <= today+7 < WARNING
// <= today+30 < OK, no expiry is OK.
// -----------------------------------------------------------------------------
TEST(ExpiryClassificationTest, BoundariesAreInclusive) {
  const auto today = CalendarDate::parse("2025-01-10");
  auto classify = [&](int offset) {
    return mfg::domain::classifyExpiry(today.addDays(offset), today, 7, 30);
  };

  EXPECT_EQ(classify(-1), ExpiryStatus::Expired);
  EXPECT_EQ(classify(0), ExpiryStatus::Critical);
  EXPECT_EQ(classify(7), ExpiryStatus::Critical);
  EXPECT_EQ(classify(8), ExpiryStatus::Warning);
  EXPECT_EQ(classify(30), ExpiryStatus::Warning);
  EXPECT_EQ(classify(31), ExpiryStatus::Ok);
  EXPECT_EQ(mfg::domain::classifyExpiry(std::nullopt, today, 7, 30),
            ExpiryStatus::Ok);
}
