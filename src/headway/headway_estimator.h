#pragma once

#include <optional>
#include <string>
#include <vector>

#include "events/event_classifier.h"
#include "gtfs/gtfs.h"
#include "schedule/schedule_reference.h"

namespace transitperf {

// A stop qualifies as a reference stop if at least this share of the busiest
// stop's trips serve it.
constexpr double kReferenceStopTripShare = 0.8;

// Longer gaps are treated as missing data rather than service.
constexpr int kMaxHeadwaySeconds = 120 * 60;

struct HeadwayObservation {
  GtfsRouteId route_id;
  GtfsStopId stop_id;
  std::string vehicle_a;
  std::string vehicle_b;
  int gap_seconds;
  std::string day;
  // Gap above kMaxHeadwaySeconds; reported but left out of statistics.
  bool data_gap;

  bool operator==(const HeadwayObservation& other) const = default;
};

// One stop per direction of `route_id`, sorted by id: among the stops served
// by at least kReferenceStopTripShare of the direction's busiest stop's trip
// count, the one in the middle by average stop position.
std::vector<GtfsStopId> ChooseReferenceStops(
    const ScheduleReference& schedule, const GtfsRouteId& route_id
);

// Gaps between successive passes at each stop. A pass is an arrival event's
// closest-approach timestamp.
std::vector<HeadwayObservation> EstimateHeadways(
    const GtfsRouteId& route_id,
    const std::string& day,
    const std::vector<ArrivalEvent>& arrivals_at_reference_stops
);

struct HeadwayStats {
  // Gaps that count, i.e. excluding data gaps.
  int count = 0;
  std::optional<double> mean_seconds;
  std::optional<double> median_seconds;
  std::optional<double> min_seconds;
  std::optional<double> max_seconds;
  // Sample standard deviation. Needs at least two gaps.
  std::optional<double> stddev_seconds;
  // stddev / mean. Needs at least two gaps and a positive mean.
  std::optional<double> cv;
};

HeadwayStats ComputeHeadwayStats(
    const std::vector<HeadwayObservation>& observations
);

}  // namespace transitperf
