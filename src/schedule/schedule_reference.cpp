#include "schedule/schedule_reference.h"

#include <algorithm>
#include <set>

#include "util/date.h"

namespace transitperf {

double ScheduledTrip::ExpectedDistanceAt(double offset) const {
  if (offset <= first_offset()) {
    return stop_times.front().distance_along;
  }
  if (offset >= last_offset()) {
    return stop_times.back().distance_along;
  }
  for (size_t i = 0; i + 1 < stop_times.size(); ++i) {
    const ScheduledStopTime& a = stop_times[i];
    const ScheduledStopTime& b = stop_times[i + 1];
    if (offset <= b.arrival_offset) {
      const double t = (offset - a.arrival_offset) /
                       static_cast<double>(b.arrival_offset - a.arrival_offset);
      return a.distance_along + t * (b.distance_along - a.distance_along);
    }
  }
  return stop_times.back().distance_along;
}

double ScheduledTrip::ImpliedOffsetAt(double distance) const {
  if (distance <= stop_times.front().distance_along) {
    return first_offset();
  }
  if (distance >= stop_times.back().distance_along) {
    return last_offset();
  }
  for (size_t i = 0; i + 1 < stop_times.size(); ++i) {
    const ScheduledStopTime& a = stop_times[i];
    const ScheduledStopTime& b = stop_times[i + 1];
    if (distance <= b.distance_along) {
      const double span = b.distance_along - a.distance_along;
      if (span <= 0.0) {
        return a.arrival_offset;
      }
      const double t = (distance - a.distance_along) / span;
      return a.arrival_offset + t * (b.arrival_offset - a.arrival_offset);
    }
  }
  return last_offset();
}

const ScheduledStopTime* ScheduledTrip::NextStopAt(double distance) const {
  for (const auto& stop_time : stop_times) {
    if (stop_time.distance_along >= distance) {
      return &stop_time;
    }
  }
  return nullptr;
}

namespace {

std::unordered_map<GtfsShapeId, std::shared_ptr<const Polyline>> BuildShapes(
    const std::vector<GtfsShapePoint>& shape_points
) {
  std::unordered_map<GtfsShapeId, std::vector<const GtfsShapePoint*>> grouped;
  for (const auto& point : shape_points) {
    grouped[point.shape_id].push_back(&point);
  }

  std::unordered_map<GtfsShapeId, std::shared_ptr<const Polyline>> shapes;
  for (auto& [shape_id, points] : grouped) {
    if (points.size() < 2) {
      continue;
    }
    std::sort(points.begin(), points.end(), [](const auto* a, const auto* b) {
      return a->shape_pt_sequence < b->shape_pt_sequence;
    });
    std::vector<LatLon> coords;
    coords.reserve(points.size());
    for (const auto* point : points) {
      coords.push_back(LatLon{point->shape_pt_lat, point->shape_pt_lon});
    }
    shapes.emplace(shape_id, std::make_shared<const Polyline>(std::move(coords)));
  }
  return shapes;
}

}  // namespace

ScheduleReference::ScheduleReference(
    const GtfsDay& day, const TextLogger& logger
)
    : date_(day.date), day_start_(DayStartTimestamp(day.date)) {
  for (const auto& route : day.routes) {
    routes_.emplace(route.route_id, route);
  }
  for (const auto& stop : day.stops) {
    stops_.emplace(stop.stop_id, stop);
  }

  const auto shapes = BuildShapes(day.shapes);

  std::unordered_map<GtfsTripId, std::vector<const GtfsStopTime*>>
      stop_times_by_trip;
  for (const auto& stop_time : day.stop_times) {
    stop_times_by_trip[stop_time.trip_id].push_back(&stop_time);
  }

  for (const auto& trip : day.trips) {
    auto st_it = stop_times_by_trip.find(trip.trip_id);
    if (st_it == stop_times_by_trip.end() || st_it->second.size() < 2) {
      Log(logger, "Dropping trip {}: fewer than two timed stops", trip.trip_id.v);
      dropped_trips_++;
      continue;
    }
    if (!routes_.contains(trip.route_id)) {
      Log(
          logger,
          "Dropping trip {}: unknown route {}",
          trip.trip_id.v,
          trip.route_id.v
      );
      dropped_trips_++;
      continue;
    }

    auto& raw = st_it->second;
    std::sort(raw.begin(), raw.end(), [](const auto* a, const auto* b) {
      return a->stop_sequence < b->stop_sequence;
    });

    ScheduledTrip scheduled{
        .trip_id = trip.trip_id,
        .route_id = trip.route_id,
        .direction_id = trip.direction_id,
        .service_id = trip.service_id,
        .stop_times = {},
        .path = nullptr,
    };

    bool valid = true;
    std::vector<LatLon> stop_coords;
    for (const auto* stop_time : raw) {
      auto stop_it = stops_.find(stop_time->stop_id);
      if (stop_it == stops_.end()) {
        Log(
            logger,
            "Dropping trip {}: unknown stop {}",
            trip.trip_id.v,
            stop_time->stop_id.v
        );
        valid = false;
        break;
      }
      if (!scheduled.stop_times.empty() &&
          stop_time->arrival_time.seconds <=
              scheduled.stop_times.back().arrival_offset) {
        Log(
            logger,
            "Dropping trip {}: stop times not increasing at sequence {}",
            trip.trip_id.v,
            stop_time->stop_sequence
        );
        valid = false;
        break;
      }
      scheduled.stop_times.push_back(ScheduledStopTime{
          .stop_id = stop_time->stop_id,
          .stop_sequence = stop_time->stop_sequence,
          .arrival_offset = stop_time->arrival_time.seconds,
          .distance_along = 0.0,
      });
      stop_coords.push_back(
          LatLon{stop_it->second.stop_lat, stop_it->second.stop_lon}
      );
    }
    if (!valid) {
      dropped_trips_++;
      continue;
    }

    std::shared_ptr<const Polyline> shape;
    if (trip.shape_id) {
      auto shape_it = shapes.find(*trip.shape_id);
      if (shape_it != shapes.end()) {
        shape = shape_it->second;
      }
    }

    if (shape) {
      // Project stops in order so distances never go backwards on paths that
      // revisit the same street.
      double min_along = 0.0;
      for (size_t i = 0; i < stop_coords.size(); ++i) {
        auto projection = shape->ProjectBetween(
            stop_coords[i], min_along, shape->length_meters()
        );
        scheduled.stop_times[i].distance_along = projection->distance_along;
        min_along = projection->distance_along;
      }
      scheduled.path = std::move(shape);
    } else {
      auto path = std::make_shared<const Polyline>(stop_coords);
      for (size_t i = 0; i < stop_coords.size(); ++i) {
        scheduled.stop_times[i].distance_along = path->cumulative_meters()[i];
      }
      scheduled.path = std::move(path);
    }

    route_trips_[trip.route_id].push_back(trip.trip_id);
    trips_.emplace(trip.trip_id, std::move(scheduled));
  }

  for (auto& [route_id, trip_ids] : route_trips_) {
    std::sort(trip_ids.begin(), trip_ids.end());
  }
}

const GtfsRoute* ScheduleReference::FindRoute(const GtfsRouteId& route_id
) const {
  auto it = routes_.find(route_id);
  return it == routes_.end() ? nullptr : &it->second;
}

const ScheduledTrip* ScheduleReference::FindTrip(const GtfsTripId& trip_id
) const {
  auto it = trips_.find(trip_id);
  return it == trips_.end() ? nullptr : &it->second;
}

const GtfsStop* ScheduleReference::FindStop(const GtfsStopId& stop_id) const {
  auto it = stops_.find(stop_id);
  return it == stops_.end() ? nullptr : &it->second;
}

std::vector<GtfsRouteId> ScheduleReference::RouteIds() const {
  std::vector<GtfsRouteId> result;
  result.reserve(route_trips_.size());
  for (const auto& [route_id, trip_ids] : route_trips_) {
    result.push_back(route_id);
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::vector<const ScheduledTrip*> ScheduleReference::TripsForRoute(
    const GtfsRouteId& route_id
) const {
  std::vector<const ScheduledTrip*> result;
  auto it = route_trips_.find(route_id);
  if (it == route_trips_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (const auto& trip_id : it->second) {
    result.push_back(&trips_.at(trip_id));
  }
  return result;
}

std::vector<GtfsStopId> ScheduleReference::StopsForRoute(
    const GtfsRouteId& route_id
) const {
  std::set<GtfsStopId> stop_ids;
  for (const ScheduledTrip* trip : TripsForRoute(route_id)) {
    for (const auto& stop_time : trip->stop_times) {
      stop_ids.insert(stop_time.stop_id);
    }
  }
  return std::vector<GtfsStopId>(stop_ids.begin(), stop_ids.end());
}

}  // namespace transitperf
