#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "geo/geo.h"
#include "gtfs/gtfs.h"
#include "schedule/schedule_reference.h"

namespace transitperf {

// A sample within this distance of a stop counts as being at the stop.
constexpr double kAtStopMeters = 50.0;

inline bool IsAtStop(double distance_meters) {
  return distance_meters <= kAtStopMeters;
}

struct NearestStop {
  GtfsStopId stop_id;
  double distance_meters;
};

// Nearest-stop lookups restricted to the stops a route visits. Each worker
// owns its own instance; the per-route candidate lists are built lazily on
// first use and never shared.
class StopIndex {
 public:
  explicit StopIndex(const ScheduleReference& schedule);

  StopIndex(const StopIndex&) = delete;
  StopIndex& operator=(const StopIndex&) = delete;

  // Nearest stop of `route_id` to `point`, ties broken by stop id. nullopt if
  // the route visits no stops.
  std::optional<NearestStop> Nearest(
      const GtfsRouteId& route_id, const LatLon& point
  );

  // Number of stops the route visits.
  size_t StopCount(const GtfsRouteId& route_id);

 private:
  struct IndexedStop {
    GtfsStopId stop_id;
    LatLon location;
  };

  const std::vector<IndexedStop>& StopsFor(const GtfsRouteId& route_id);

  const ScheduleReference& schedule_;
  std::unordered_map<GtfsRouteId, std::vector<IndexedStop>> cache_;
};

}  // namespace transitperf
