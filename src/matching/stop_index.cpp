#include "matching/stop_index.h"

namespace transitperf {

StopIndex::StopIndex(const ScheduleReference& schedule) : schedule_(schedule) {}

const std::vector<StopIndex::IndexedStop>& StopIndex::StopsFor(
    const GtfsRouteId& route_id
) {
  auto it = cache_.find(route_id);
  if (it != cache_.end()) {
    return it->second;
  }

  std::vector<IndexedStop> stops;
  for (const auto& stop_id : schedule_.StopsForRoute(route_id)) {
    const GtfsStop* stop = schedule_.FindStop(stop_id);
    if (stop == nullptr) {
      continue;
    }
    stops.push_back(IndexedStop{stop_id, LatLon{stop->stop_lat, stop->stop_lon}});
  }
  return cache_.emplace(route_id, std::move(stops)).first->second;
}

std::optional<NearestStop> StopIndex::Nearest(
    const GtfsRouteId& route_id, const LatLon& point
) {
  std::optional<NearestStop> best;
  // Stops are sorted by id, so a strict comparison keeps the smallest id on
  // ties.
  for (const auto& stop : StopsFor(route_id)) {
    const double distance = HaversineMeters(point, stop.location);
    if (!best || distance < best->distance_meters) {
      best = NearestStop{stop.stop_id, distance};
    }
  }
  return best;
}

size_t StopIndex::StopCount(const GtfsRouteId& route_id) {
  return StopsFor(route_id).size();
}

}  // namespace transitperf
