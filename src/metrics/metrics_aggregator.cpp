#include "metrics/metrics_aggregator.h"

#include <algorithm>
#include <format>
#include <mutex>
#include <numeric>
#include <set>
#include <stdexcept>
#include <thread>
#include <variant>

#include "events/event_classifier.h"
#include "headway/headway_estimator.h"
#include "matching/trip_matcher.h"
#include "util/date.h"

namespace transitperf {

namespace {

// Ends a unit with the given failure reason.
class UnitFailure : public std::runtime_error {
 public:
  UnitFailure(std::string reason, const std::string& detail)
      : std::runtime_error(detail), reason_(std::move(reason)) {}

  const std::string& reason() const { return reason_; }

 private:
  std::string reason_;
};

class Deadline {
 public:
  explicit Deadline(std::chrono::milliseconds budget)
      : end_(std::chrono::steady_clock::now() + budget) {}

  void Check() const {
    if (std::chrono::steady_clock::now() >= end_) {
      throw UnitFailure("timeout", "wall-clock budget exceeded");
    }
  }

 private:
  std::chrono::steady_clock::time_point end_;
};

std::optional<double> Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

std::optional<double> Median(std::vector<double> values) {
  if (values.empty()) {
    return std::nullopt;
  }
  std::sort(values.begin(), values.end());
  const size_t mid = values.size() / 2;
  return values.size() % 2 == 1 ? values[mid]
                                 : (values[mid - 1] + values[mid]) / 2.0;
}

std::optional<double> ToMinutes(const std::optional<double>& seconds) {
  if (!seconds) {
    return std::nullopt;
  }
  return *seconds / 60.0;
}

struct UnitInputs {
  const GtfsRouteId& route_id;
  const std::string& day;
  const std::vector<PositionSample>& samples;
  int invalid_samples;
  const std::vector<MatchedSample>& matches;
  const ClassifiedSamples& classified;
  const OtpBreakdown& otp;
  const HeadwayStats& headways;
  const std::vector<VendorObservation>& vendor;
};

DailyMetricRows BuildDailyMetricRows(const UnitInputs& in) {
  DailyMetricRows rows;
  DailyMetric& m = rows.metric;
  m.route_id = in.route_id;
  m.day = in.day;

  m.otp_percent = in.otp.line.OnTimePercent();
  m.early_percent = in.otp.line.EarlyPercent();
  m.late_percent = in.otp.line.LatePercent();

  m.avg_headway_minutes = ToMinutes(in.headways.mean_seconds);
  m.median_headway_minutes = ToMinutes(in.headways.median_seconds);
  m.min_headway_minutes = ToMinutes(in.headways.min_seconds);
  m.max_headway_minutes = ToMinutes(in.headways.max_seconds);
  m.headway_stddev_minutes = ToMinutes(in.headways.stddev_seconds);
  m.headway_cv = in.headways.cv;

  std::vector<double> mph;
  mph.reserve(in.classified.speeds.size());
  for (const auto& speed : in.classified.speeds) {
    mph.push_back(speed.mph());
  }
  m.avg_speed_mph = Mean(mph);
  m.median_speed_mph = Median(mph);

  std::vector<double> deviations;
  deviations.reserve(in.classified.events.size());
  for (const auto& event : in.classified.events) {
    deviations.push_back(event.deviation_seconds);
  }
  m.avg_deviation_seconds = Mean(deviations);

  std::set<std::string> vehicles;
  for (const auto& sample : in.samples) {
    if (IsValidSample(sample)) {
      vehicles.insert(sample.vehicle_id);
    }
  }
  std::set<GtfsTripId> trips;
  for (const auto& matched : in.matches) {
    trips.insert(matched.match.trip_id);
  }

  m.total_samples = static_cast<int>(in.samples.size());
  m.matched_samples = static_cast<int>(in.matches.size());
  m.invalid_samples = in.invalid_samples;
  m.arrival_events = static_cast<int>(in.classified.events.size());
  m.unique_vehicles = static_cast<int>(vehicles.size());
  m.unique_trips = static_cast<int>(trips.size());

  OtpCounts vendor_counts;
  for (const auto& observation : in.vendor) {
    vendor_counts.Add(observation.classification);
  }
  m.vendor_otp_percent = vendor_counts.OnTimePercent();
  m.vendor_observations = vendor_counts.total();

  for (const auto& [stop_id, counts] : in.otp.by_stop) {
    rows.stops.push_back(StopOtp{
        .stop_id = stop_id,
        .early = counts.early,
        .on_time = counts.on_time,
        .late = counts.late,
        .otp_percent = counts.OnTimePercent(),
    });
  }
  for (const auto& [period, counts] : in.otp.by_period) {
    rows.periods.push_back(PeriodOtp{
        .period = std::string(TimePeriodName(period)),
        .early = counts.early,
        .on_time = counts.on_time,
        .late = counts.late,
        .otp_percent = counts.OnTimePercent(),
    });
  }
  return rows;
}

}  // namespace

MetricsAggregator::MetricsAggregator(
    const Gtfs& gtfs,
    PositionStore& positions,
    MetricsWriter& metrics,
    AggregatorOptions options,
    TextLogger logger
)
    : gtfs_(gtfs),
      positions_(positions),
      metrics_(metrics),
      options_(options),
      logger_(SynchronizedLogger(std::move(logger))) {}

RunReport MetricsAggregator::Run(const RunRequest& request) {
  if (!IsValidDate(request.start_date) || !IsValidDate(request.end_date)) {
    throw std::runtime_error(
        "Invalid day range: " + request.start_date + " to " + request.end_date
    );
  }
  const std::vector<std::string> days =
      DateRange(request.start_date, request.end_date);
  if (days.empty()) {
    throw std::runtime_error(
        "Empty day range: " + request.start_date + " to " + request.end_date
    );
  }

  RunReport run;
  for (const std::string& day : days) {
    const ScheduleReference schedule(GtfsFilterByDate(gtfs_, day), logger_);
    if (schedule.dropped_trips() > 0) {
      Log(
          logger_,
          "{}: dropped {} invalid trips",
          day,
          schedule.dropped_trips()
      );
    }

    std::vector<GtfsRouteId> routes;
    if (request.route_filter) {
      routes.push_back(*request.route_filter);
    } else {
      const int64_t start = schedule.day_start();
      std::set<GtfsRouteId> route_set;
      for (const auto& route_id : schedule.RouteIds()) {
        route_set.insert(route_id);
      }
      try {
        for (const auto& route_id :
             positions_.RoutesWithSamples(start, start + kSecondsPerDay)) {
          route_set.insert(route_id);
        }
      } catch (const std::runtime_error& e) {
        // Routes known only from their samples are lost for this day. The
        // scheduled routes still run as units.
        Log(
            logger_,
            "{}: listing routes with samples failed: {}",
            day,
            e.what()
        );
        JobReport report;
        report.route_id = std::string(kAllRoutes);
        report.day = day;
        report.status = JobState::kFailed;
        report.reason = "read_error";
        run.failed++;
        run.jobs.push_back(std::move(report));
      }
      routes.assign(route_set.begin(), route_set.end());
    }
    Log(logger_, "{}: {} units", day, routes.size());

    std::vector<JobReport> reports(routes.size());
    std::mutex mutex;
    size_t next_unit = 0;

    unsigned int num_threads =
        options_.workers > 0
            ? static_cast<unsigned int>(options_.workers)
            : std::max(1u, std::thread::hardware_concurrency());
    num_threads = std::min<unsigned int>(
        num_threads, std::max<size_t>(1, routes.size())
    );

    // Each worker owns its stop index and claims units until none are left.
    auto worker = [&]() {
      StopIndex stop_index(schedule);
      while (true) {
        size_t i;
        {
          std::lock_guard<std::mutex> lock(mutex);
          i = next_unit;
          next_unit += 1;
        }
        if (i >= routes.size()) {
          break;
        }
        reports[i] =
            RunUnit(schedule, stop_index, routes[i], request.recalculate);
      }
    };

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (unsigned int t = 0; t < num_threads; ++t) {
      threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
      thread.join();
    }

    for (auto& report : reports) {
      switch (report.status) {
        case JobState::kPersisted:
          run.persisted++;
          break;
        case JobState::kSkipped:
          run.skipped++;
          break;
        default:
          run.failed++;
          break;
      }
      run.jobs.push_back(std::move(report));
    }
  }

  Log(
      logger_,
      "Run finished: {} persisted, {} skipped, {} failed",
      run.persisted,
      run.skipped,
      run.failed
  );
  return run;
}

JobReport MetricsAggregator::RunUnit(
    const ScheduleReference& schedule,
    StopIndex& stop_index,
    const GtfsRouteId& route_id,
    bool recalculate
) {
  JobReport report;
  report.route_id = route_id.v;
  report.day = schedule.date();

  try {
    if (!recalculate && metrics_.HasDailyMetric(route_id, schedule.date())) {
      report.status = JobState::kSkipped;
      return report;
    }

    const Deadline deadline(options_.job_timeout);

    if (schedule.FindRoute(route_id) == nullptr ||
        schedule.TripsForRoute(route_id).empty()) {
      throw UnitFailure("no_schedule", "route has no trips in service");
    }
    if (stop_index.StopCount(route_id) == 0) {
      throw UnitFailure("no_stops", "route visits no stops");
    }

    std::vector<PositionSample> samples;
    try {
      samples = positions_.Load(
          route_id, schedule.day_start(), schedule.day_start() + kSecondsPerDay
      );
    } catch (const std::runtime_error& e) {
      throw UnitFailure("read_error", e.what());
    }
    report.samples_seen = static_cast<int>(samples.size());
    if (samples.empty()) {
      throw UnitFailure("no_samples", "no position samples");
    }
    const int valid = static_cast<int>(
        std::count_if(samples.begin(), samples.end(), IsValidSample)
    );
    report.samples_invalid = report.samples_seen - valid;
    if (valid < options_.min_samples) {
      throw UnitFailure(
          "insufficient_samples",
          std::format("{} valid samples, need {}", valid, options_.min_samples)
      );
    }

    report.status = JobState::kMatching;
    std::vector<MatchedSample> matches;
    for (const auto& sample : samples) {
      deadline.Check();
      MatchResult result = MatchSample(sample, schedule, stop_index);
      if (auto* match = std::get_if<TripMatch>(&result)) {
        matches.push_back(MatchedSample{sample, std::move(*match)});
      }
    }
    report.samples_matched = static_cast<int>(matches.size());

    deadline.Check();
    report.status = JobState::kClassifying;
    const ClassifiedSamples classified =
        ClassifyMatches(route_id, schedule, matches);
    const std::vector<VendorObservation> vendor =
        ClassifyVendorDeviations(samples);
    report.events_produced = static_cast<int>(classified.events.size());
    report.speed_outliers = classified.speed_outliers;

    deadline.Check();
    report.status = JobState::kAggregating;
    const OtpBreakdown otp = AggregateOtp(classified.events, schedule.day_start());

    const std::vector<GtfsStopId> reference_stops =
        ChooseReferenceStops(schedule, route_id);
    std::vector<ArrivalEvent> reference_arrivals;
    for (const auto& event : classified.events) {
      if (std::find(
              reference_stops.begin(), reference_stops.end(), event.stop_id
          ) != reference_stops.end()) {
        reference_arrivals.push_back(event);
      }
    }
    const std::vector<HeadwayObservation> headways =
        EstimateHeadways(route_id, schedule.date(), reference_arrivals);
    report.headway_observations = static_cast<int>(headways.size());
    const HeadwayStats headway_stats = ComputeHeadwayStats(headways);

    const DailyMetricRows rows = BuildDailyMetricRows(UnitInputs{
        .route_id = route_id,
        .day = schedule.date(),
        .samples = samples,
        .invalid_samples = report.samples_invalid,
        .matches = matches,
        .classified = classified,
        .otp = otp,
        .headways = headway_stats,
        .vendor = vendor,
    });

    // Nothing has been written yet, so a timeout here leaves no trace.
    deadline.Check();
    for (int attempt = 1;; ++attempt) {
      report.write_attempts = attempt;
      try {
        metrics_.CommitDay(rows);
        break;
      } catch (const std::runtime_error& e) {
        Log(
            logger_,
            "{} {}: write attempt {} failed: {}",
            route_id.v,
            schedule.date(),
            attempt,
            e.what()
        );
        if (attempt >= options_.max_write_attempts) {
          throw UnitFailure("persistence_error", e.what());
        }
        std::this_thread::sleep_for(
            options_.retry_backoff *
            (1 << std::min(attempt - 1, kMaxBackoffDoublings))
        );
      }
    }

    report.status = JobState::kPersisted;
    Log(
        logger_,
        "{} {}: persisted ({} samples, {} matched, {} events, {} headways)",
        route_id.v,
        schedule.date(),
        report.samples_seen,
        report.samples_matched,
        report.events_produced,
        report.headway_observations
    );
  } catch (const UnitFailure& e) {
    report.status = JobState::kFailed;
    report.reason = e.reason();
    Log(
        logger_,
        "{} {}: failed with {} ({})",
        route_id.v,
        schedule.date(),
        e.reason(),
        e.what()
    );
  } catch (const std::exception& e) {
    report.status = JobState::kFailed;
    report.reason = "internal_error";
    Log(
        logger_,
        "{} {}: failed with internal_error ({})",
        route_id.v,
        schedule.date(),
        e.what()
    );
  }
  return report;
}

}  // namespace transitperf
