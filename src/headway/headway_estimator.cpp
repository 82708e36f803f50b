#include "headway/headway_estimator.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace transitperf {

std::vector<GtfsStopId> ChooseReferenceStops(
    const ScheduleReference& schedule, const GtfsRouteId& route_id
) {
  struct StopUsage {
    int trips = 0;
    double position_sum = 0.0;
  };
  std::map<int, std::map<GtfsStopId, StopUsage>> usage_by_direction;
  for (const ScheduledTrip* trip : schedule.TripsForRoute(route_id)) {
    auto& usage = usage_by_direction[trip->direction_id];
    for (size_t i = 0; i < trip->stop_times.size(); ++i) {
      StopUsage& stop_usage = usage[trip->stop_times[i].stop_id];
      stop_usage.trips++;
      stop_usage.position_sum += static_cast<double>(i);
    }
  }

  std::vector<GtfsStopId> reference_stops;
  for (const auto& [direction, usage] : usage_by_direction) {
    int max_trips = 0;
    for (const auto& [stop_id, stop_usage] : usage) {
      max_trips = std::max(max_trips, stop_usage.trips);
    }

    std::vector<std::pair<double, GtfsStopId>> candidates;
    for (const auto& [stop_id, stop_usage] : usage) {
      if (stop_usage.trips >= kReferenceStopTripShare * max_trips) {
        candidates.emplace_back(
            stop_usage.position_sum / stop_usage.trips, stop_id
        );
      }
    }
    std::sort(candidates.begin(), candidates.end());
    const GtfsStopId& middle = candidates[candidates.size() / 2].second;
    if (std::find(reference_stops.begin(), reference_stops.end(), middle) ==
        reference_stops.end()) {
      reference_stops.push_back(middle);
    }
  }
  std::sort(reference_stops.begin(), reference_stops.end());
  return reference_stops;
}

std::vector<HeadwayObservation> EstimateHeadways(
    const GtfsRouteId& route_id,
    const std::string& day,
    const std::vector<ArrivalEvent>& arrivals_at_reference_stops
) {
  std::map<GtfsStopId, std::vector<const ArrivalEvent*>> passes_by_stop;
  for (const auto& event : arrivals_at_reference_stops) {
    passes_by_stop[event.stop_id].push_back(&event);
  }

  std::vector<HeadwayObservation> observations;
  for (auto& [stop_id, passes] : passes_by_stop) {
    std::sort(
        passes.begin(),
        passes.end(),
        [](const ArrivalEvent* a, const ArrivalEvent* b) {
          if (a->observed_time != b->observed_time) {
            return a->observed_time < b->observed_time;
          }
          return a->vehicle_id < b->vehicle_id;
        }
    );
    for (size_t i = 1; i < passes.size(); ++i) {
      const int gap =
          static_cast<int>(passes[i]->observed_time - passes[i - 1]->observed_time);
      observations.push_back(HeadwayObservation{
          .route_id = route_id,
          .stop_id = stop_id,
          .vehicle_a = passes[i - 1]->vehicle_id,
          .vehicle_b = passes[i]->vehicle_id,
          .gap_seconds = gap,
          .day = day,
          .data_gap = gap > kMaxHeadwaySeconds,
      });
    }
  }
  return observations;
}

HeadwayStats ComputeHeadwayStats(
    const std::vector<HeadwayObservation>& observations
) {
  std::vector<double> gaps;
  for (const auto& observation : observations) {
    if (!observation.data_gap) {
      gaps.push_back(observation.gap_seconds);
    }
  }

  HeadwayStats stats;
  stats.count = static_cast<int>(gaps.size());
  if (gaps.empty()) {
    return stats;
  }

  std::sort(gaps.begin(), gaps.end());
  const double n = static_cast<double>(gaps.size());
  const double mean = std::accumulate(gaps.begin(), gaps.end(), 0.0) / n;
  stats.mean_seconds = mean;
  stats.min_seconds = gaps.front();
  stats.max_seconds = gaps.back();
  const size_t mid = gaps.size() / 2;
  stats.median_seconds =
      gaps.size() % 2 == 1 ? gaps[mid] : (gaps[mid - 1] + gaps[mid]) / 2.0;

  if (gaps.size() < 2) {
    return stats;
  }
  double squares = 0.0;
  for (double gap : gaps) {
    squares += (gap - mean) * (gap - mean);
  }
  const double stddev = std::sqrt(squares / (n - 1));
  stats.stddev_seconds = stddev;
  if (mean > 0.0) {
    stats.cv = stddev / mean;
  }
  return stats;
}

}  // namespace transitperf
