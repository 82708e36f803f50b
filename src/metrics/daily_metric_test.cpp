#include "metrics/daily_metric.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace transitperf {
namespace {

DailyMetric Row(
    const std::string& route,
    const std::string& day,
    std::optional<double> otp,
    std::optional<double> speed,
    int events,
    int vehicles
) {
  DailyMetric row;
  row.route_id = GtfsRouteId{route};
  row.day = day;
  row.otp_percent = otp;
  row.avg_speed_mph = speed;
  row.arrival_events = events;
  row.unique_vehicles = vehicles;
  return row;
}

TEST(RollingSummaryTest, NoRowsForRouteHasNoSummary) {
  EXPECT_EQ(
      ComputeRollingSummary(
          GtfsRouteId{"C51"}, {Row("X51", "20250708", 80.0, 10.0, 1, 1)}, 7
      ),
      std::nullopt
  );
}

TEST(RollingSummaryTest, AveragesWithinWindowEndingAtLatestDay) {
  std::vector<DailyMetric> rows = {
      // Outside the 7 day window ending 20250710.
      Row("C51", "20250703", 0.0, 0.0, 100, 100),
      Row("C51", "20250704", 70.0, 10.0, 10, 3),
      Row("C51", "20250710", 90.0, std::nullopt, 20, 4),
      Row("X51", "20250709", 10.0, 1.0, 5, 5),
  };

  auto summary = ComputeRollingSummary(GtfsRouteId{"C51"}, rows, 7);
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->date_start, "20250704");
  EXPECT_EQ(summary->date_end, "20250710");
  EXPECT_EQ(summary->window_days, 7);
  EXPECT_EQ(summary->days_analyzed, 2);
  EXPECT_DOUBLE_EQ(*summary->otp_percent, 80.0);
  // The null speed day is skipped, not averaged in as zero.
  EXPECT_DOUBLE_EQ(*summary->avg_speed_mph, 10.0);
  EXPECT_EQ(summary->early_percent, std::nullopt);
  EXPECT_EQ(summary->total_arrival_events, 30);
  EXPECT_EQ(summary->total_vehicles, 7);
}

TEST(RollingSummaryTest, IndependentOfRowOrder) {
  std::vector<DailyMetric> rows = {
      Row("C51", "20250706", 71.3, 9.1, 10, 3),
      Row("C51", "20250707", 88.9, 12.7, 12, 4),
      Row("C51", "20250708", 64.2, 11.3, 9, 3),
  };
  auto forward = ComputeRollingSummary(GtfsRouteId{"C51"}, rows, 7);
  std::reverse(rows.begin(), rows.end());
  auto backward = ComputeRollingSummary(GtfsRouteId{"C51"}, rows, 7);
  EXPECT_EQ(forward, backward);
}

}  // namespace
}  // namespace transitperf
