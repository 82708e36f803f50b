#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "geo/geo.h"
#include "gtfs/gtfs.h"
#include "log.h"

namespace transitperf {

struct ScheduledStopTime {
  GtfsStopId stop_id;
  int stop_sequence;
  // Seconds since the start of the service day.
  int arrival_offset;
  // Meters along the trip's path.
  double distance_along;
};

struct ScheduledTrip {
  GtfsTripId trip_id;
  GtfsRouteId route_id;
  int direction_id;
  GtfsServiceId service_id;
  // Ordered by stop_sequence; arrival_offset is strictly increasing.
  std::vector<ScheduledStopTime> stop_times;
  std::shared_ptr<const Polyline> path;

  int first_offset() const { return stop_times.front().arrival_offset; }
  int last_offset() const { return stop_times.back().arrival_offset; }

  // Where the vehicle should be along the path at `offset` seconds into the
  // service day. Linear in time between consecutive scheduled stops; clamped
  // to the first and last stop outside the trip's span.
  double ExpectedDistanceAt(double offset) const;

  // The schedule offset implied by being `distance` meters along the path.
  // Linear in distance between consecutive scheduled stops; clamped at the
  // ends.
  double ImpliedOffsetAt(double distance) const;

  // The first stop at or beyond `distance` along the path, or nullptr past
  // the last stop.
  const ScheduledStopTime* NextStopAt(double distance) const;
};

// Read-only, indexed view of one service day of a GTFS feed. Built once per
// day and shared between workers.
class ScheduleReference {
 public:
  // Trips with non-increasing stop times, fewer than two timed stops or
  // unknown stops are dropped and counted.
  ScheduleReference(const GtfsDay& day, const TextLogger& logger);

  ScheduleReference(const ScheduleReference&) = delete;
  ScheduleReference& operator=(const ScheduleReference&) = delete;

  const std::string& date() const { return date_; }
  // Local timestamp of midnight at the start of the service day.
  int64_t day_start() const { return day_start_; }
  int dropped_trips() const { return dropped_trips_; }

  const GtfsRoute* FindRoute(const GtfsRouteId& route_id) const;
  const ScheduledTrip* FindTrip(const GtfsTripId& trip_id) const;
  const GtfsStop* FindStop(const GtfsStopId& stop_id) const;

  // Routes with at least one valid trip, sorted by id.
  std::vector<GtfsRouteId> RouteIds() const;

  // Trips of `route_id` sorted by trip id. Empty for unknown routes.
  std::vector<const ScheduledTrip*> TripsForRoute(const GtfsRouteId& route_id
  ) const;

  // Distinct stops visited by trips of `route_id`, sorted by id.
  std::vector<GtfsStopId> StopsForRoute(const GtfsRouteId& route_id) const;

 private:
  std::string date_;
  int64_t day_start_;
  int dropped_trips_ = 0;

  std::unordered_map<GtfsRouteId, GtfsRoute> routes_;
  std::unordered_map<GtfsStopId, GtfsStop> stops_;
  std::unordered_map<GtfsTripId, ScheduledTrip> trips_;
  std::unordered_map<GtfsRouteId, std::vector<GtfsTripId>> route_trips_;
};

}  // namespace transitperf
