#include "util/date.h"

#include <gtest/gtest.h>

#include <stdexcept>

namespace transitperf {
namespace {

TEST(OffsetDateTest, IncrementByOne) {
  EXPECT_EQ(OffsetDate("20250101", 1), "20250102");
}

TEST(OffsetDateTest, CrossMonthBoundaryBackward) {
  EXPECT_EQ(OffsetDate("20250201", -1), "20250131");
}

TEST(OffsetDateTest, CrossYearBoundaryForward) {
  EXPECT_EQ(OffsetDate("20241231", 1), "20250101");
}

TEST(OffsetDateTest, LeapYearFebruary) {
  // 2024 is a leap year
  EXPECT_EQ(OffsetDate("20240228", 1), "20240229");
  EXPECT_EQ(OffsetDate("20240229", 1), "20240301");
}

TEST(OffsetDateTest, RejectsMalformedDate) {
  EXPECT_THROW(OffsetDate("2025-01-01", 1), std::runtime_error);
}

TEST(IsValidDateTest, RejectsImpossibleDays) {
  EXPECT_TRUE(IsValidDate("20240229"));
  EXPECT_FALSE(IsValidDate("20250229"));
  EXPECT_FALSE(IsValidDate("20251301"));
  EXPECT_FALSE(IsValidDate("2025010"));
  EXPECT_FALSE(IsValidDate("2025O101"));
}

TEST(DayStartTimestampTest, EpochAndLaterDays) {
  EXPECT_EQ(DayStartTimestamp("19700101"), 0);
  EXPECT_EQ(DayStartTimestamp("19700102"), kSecondsPerDay);
  // 2025-03-10 is day 20157 since the epoch.
  EXPECT_EQ(DayStartTimestamp("20250310"), 20157 * kSecondsPerDay);
}

TEST(DayOfWeekTest, KnownDates) {
  EXPECT_EQ(DayOfWeek("20250708"), 2);  // Tuesday
  EXPECT_EQ(DayOfWeek("20250713"), 0);  // Sunday
}

TEST(DateRangeTest, InclusiveRange) {
  EXPECT_EQ(
      DateRange("20250130", "20250202"),
      (std::vector<std::string>{"20250130", "20250131", "20250201", "20250202"})
  );
  EXPECT_TRUE(DateRange("20250202", "20250130").empty());
}

TEST(DaysBetweenTest, SignedDifference) {
  EXPECT_EQ(DaysBetween("20250101", "20250108"), 7);
  EXPECT_EQ(DaysBetween("20250108", "20250101"), -7);
}

}  // namespace
}  // namespace transitperf
