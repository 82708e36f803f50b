#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gtfs/gtfs.h"
#include "log.h"
#include "matching/stop_index.h"
#include "schedule/schedule_reference.h"
#include "store/metrics_store.h"
#include "store/position_store.h"

namespace transitperf {

// Lifecycle of one (route, day) unit. kFailed and kSkipped can follow any
// earlier state.
enum class JobState {
  kPending,
  kMatching,
  kClassifying,
  kAggregating,
  kPersisted,
  kFailed,
  kSkipped,
};

// JobReport::route_id of a failure that concerns a whole day rather than one
// route.
inline constexpr std::string_view kAllRoutes = "*";

struct JobReport {
  std::string route_id;
  std::string day;
  JobState status = JobState::kPending;
  // Set when status is kFailed: no_schedule, no_samples,
  // insufficient_samples, no_stops, timeout, read_error, persistence_error or
  // internal_error.
  std::optional<std::string> reason;
  int samples_seen = 0;
  int samples_matched = 0;
  int samples_invalid = 0;
  int events_produced = 0;
  // Consecutive-sample speeds rejected as implausible.
  int speed_outliers = 0;
  int headway_observations = 0;
  int write_attempts = 0;
};

struct RunReport {
  // Ordered by day. Within a day a kAllRoutes failure comes first, then the
  // routes in order.
  std::vector<JobReport> jobs;
  int persisted = 0;
  int skipped = 0;
  int failed = 0;

  // 0 if every unit was persisted or skipped, 2 if any failed.
  int ExitCode() const { return failed > 0 ? 2 : 0; }
};

struct RunRequest {
  // Inclusive YYYYMMDD range.
  std::string start_date;
  std::string end_date;
  std::optional<GtfsRouteId> route_filter;
  // Recompute and overwrite units that already have rows.
  bool recalculate = false;
};

// Largest max_write_attempts a config may ask for.
inline constexpr int kMaxWriteAttemptsLimit = 10;
inline constexpr int kMaxBackoffDoublings = 10;

struct AggregatorOptions {
  // 0 uses the hardware concurrency.
  int workers = 0;
  // Fewer valid samples than this fails the unit with insufficient_samples.
  int min_samples = 50;
  std::chrono::milliseconds job_timeout = std::chrono::seconds(300);
  int max_write_attempts = 3;
  // Doubled after each failed write, up to kMaxBackoffDoublings times.
  std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(200);
};

// Computes DailyMetric rows for every (route, day) unit of a run.
//
// For each day the schedule is filtered and indexed once, then shared by a
// pool of workers that claim units one at a time. The units of a day are the
// scheduled routes plus routes that have samples that day, or just the
// filtered route. A unit reads its samples, matches, classifies and
// aggregates them without further I/O, then commits its rows in one
// transaction. Any failure is confined to its unit.
class MetricsAggregator {
 public:
  MetricsAggregator(
      const Gtfs& gtfs,
      PositionStore& positions,
      MetricsWriter& metrics,
      AggregatorOptions options,
      TextLogger logger
  );

  // Throws std::runtime_error for an invalid day range.
  RunReport Run(const RunRequest& request);

 private:
  JobReport RunUnit(
      const ScheduleReference& schedule,
      StopIndex& stop_index,
      const GtfsRouteId& route_id,
      bool recalculate
  );

  const Gtfs& gtfs_;
  PositionStore& positions_;
  MetricsWriter& metrics_;
  AggregatorOptions options_;
  TextLogger logger_;
};

}  // namespace transitperf
