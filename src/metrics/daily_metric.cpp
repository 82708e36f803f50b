#include "metrics/daily_metric.h"

#include <algorithm>

#include "util/date.h"

namespace transitperf {

namespace {

std::optional<double> MeanOf(
    const std::vector<const DailyMetric*>& rows,
    std::optional<double> DailyMetric::*field
) {
  double sum = 0.0;
  int count = 0;
  for (const DailyMetric* row : rows) {
    if (const auto& value = row->*field) {
      sum += *value;
      count++;
    }
  }
  if (count == 0) {
    return std::nullopt;
  }
  return sum / count;
}

}  // namespace

std::optional<RollingSummary> ComputeRollingSummary(
    const GtfsRouteId& route_id,
    const std::vector<DailyMetric>& rows,
    int window_days
) {
  std::optional<std::string> latest;
  for (const auto& row : rows) {
    if (row.route_id == route_id && (!latest || row.day > *latest)) {
      latest = row.day;
    }
  }
  if (!latest) {
    return std::nullopt;
  }

  RollingSummary summary;
  summary.route_id = route_id;
  summary.window_days = window_days;
  summary.date_end = *latest;
  summary.date_start = OffsetDate(*latest, -(window_days - 1));

  // Sorted so that floating point sums do not depend on row order.
  std::vector<const DailyMetric*> window;
  for (const auto& row : rows) {
    if (row.route_id == route_id && row.day >= summary.date_start &&
        row.day <= summary.date_end) {
      window.push_back(&row);
    }
  }
  std::sort(window.begin(), window.end(), [](const auto* a, const auto* b) {
    return a->day < b->day;
  });

  summary.days_analyzed = static_cast<int>(window.size());
  summary.otp_percent = MeanOf(window, &DailyMetric::otp_percent);
  summary.early_percent = MeanOf(window, &DailyMetric::early_percent);
  summary.late_percent = MeanOf(window, &DailyMetric::late_percent);
  summary.avg_headway_minutes =
      MeanOf(window, &DailyMetric::avg_headway_minutes);
  summary.headway_cv = MeanOf(window, &DailyMetric::headway_cv);
  summary.avg_speed_mph = MeanOf(window, &DailyMetric::avg_speed_mph);
  for (const DailyMetric* row : window) {
    summary.total_arrival_events += row->arrival_events;
    summary.total_vehicles += row->unique_vehicles;
  }
  return summary;
}

}  // namespace transitperf
