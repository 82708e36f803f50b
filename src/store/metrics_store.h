#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gtfs/gtfs.h"
#include "metrics/daily_metric.h"
#include "store/sqlite_wrapper.h"

namespace transitperf {

// Write side of the serving tables, as seen by the aggregator.
class MetricsWriter {
 public:
  virtual ~MetricsWriter() = default;

  virtual bool HasDailyMetric(
      const GtfsRouteId& route_id, const std::string& day
  ) = 0;

  // Replaces the (route, day) rows and refreshes the route's rolling summary
  // atomically. Throws std::runtime_error on failure, leaving the tables
  // untouched.
  virtual void CommitDay(const DailyMetricRows& rows) = 0;
};

// The daily_metrics, daily_stop_otp, daily_period_otp and rolling_summary
// tables. All access goes through one connection guarded by a mutex.
class MetricsStore : public MetricsWriter {
 public:
  // Opens `path`, creating missing tables. The rolling summary covers the
  // `rolling_window_days` days ending at the route's latest persisted day.
  MetricsStore(const std::string& path, int rolling_window_days);

  bool HasDailyMetric(const GtfsRouteId& route_id, const std::string& day)
      override;
  void CommitDay(const DailyMetricRows& rows) override;

  std::optional<DailyMetric> LoadDailyMetric(
      const GtfsRouteId& route_id, const std::string& day
  );
  std::vector<StopOtp> LoadStopOtp(
      const GtfsRouteId& route_id, const std::string& day
  );
  std::vector<PeriodOtp> LoadPeriodOtp(
      const GtfsRouteId& route_id, const std::string& day
  );
  std::optional<RollingSummary> LoadRollingSummary(const GtfsRouteId& route_id);

 private:
  std::vector<DailyMetric> LoadDailyMetricsLocked(
      const GtfsRouteId& route_id,
      const std::string& first_day,
      const std::string& last_day
  );

  int rolling_window_days_;
  std::mutex mutex_;
  SqliteDb db_;
};

}  // namespace transitperf
