#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gtfs/gtfs.h"

namespace transitperf {

// One route's metrics for one service day. Values that could not be measured
// are nullopt, never zero.
struct DailyMetric {
  GtfsRouteId route_id;
  std::string day;

  std::optional<double> otp_percent;
  std::optional<double> early_percent;
  std::optional<double> late_percent;

  std::optional<double> avg_headway_minutes;
  std::optional<double> median_headway_minutes;
  std::optional<double> min_headway_minutes;
  std::optional<double> max_headway_minutes;
  std::optional<double> headway_stddev_minutes;
  std::optional<double> headway_cv;

  std::optional<double> avg_speed_mph;
  std::optional<double> median_speed_mph;

  std::optional<double> avg_deviation_seconds;

  int total_samples = 0;
  int matched_samples = 0;
  int invalid_samples = 0;
  int arrival_events = 0;
  int unique_vehicles = 0;
  int unique_trips = 0;

  // Supplementary vendor-reported deviations, kept apart from the measured
  // OTP above.
  std::optional<double> vendor_otp_percent;
  int vendor_observations = 0;

  bool operator==(const DailyMetric& other) const = default;
};

struct StopOtp {
  GtfsStopId stop_id;
  int early = 0;
  int on_time = 0;
  int late = 0;
  std::optional<double> otp_percent;

  bool operator==(const StopOtp& other) const = default;
};

struct PeriodOtp {
  std::string period;
  int early = 0;
  int on_time = 0;
  int late = 0;
  std::optional<double> otp_percent;

  bool operator==(const PeriodOtp& other) const = default;
};

// Everything persisted for one (route, day), written and replaced together.
struct DailyMetricRows {
  DailyMetric metric;
  // Sorted by stop id.
  std::vector<StopOtp> stops;
  // In time-of-day order.
  std::vector<PeriodOtp> periods;

  bool operator==(const DailyMetricRows& other) const = default;
};

// Trailing-window view of a route, recomputed from persisted daily rows.
struct RollingSummary {
  GtfsRouteId route_id;
  int window_days = 0;
  // Days in the window with a persisted row.
  int days_analyzed = 0;
  std::string date_start;
  std::string date_end;

  std::optional<double> otp_percent;
  std::optional<double> early_percent;
  std::optional<double> late_percent;
  std::optional<double> avg_headway_minutes;
  std::optional<double> headway_cv;
  std::optional<double> avg_speed_mph;

  int total_arrival_events = 0;
  int total_vehicles = 0;

  bool operator==(const RollingSummary& other) const = default;
};

// Summarizes the rows of `route_id` within the `window_days` days ending at
// the latest row's day. Averages skip days where the value is null. Rows
// outside the window are ignored. nullopt if `rows` has none for the route.
std::optional<RollingSummary> ComputeRollingSummary(
    const GtfsRouteId& route_id,
    const std::vector<DailyMetric>& rows,
    int window_days
);

}  // namespace transitperf
