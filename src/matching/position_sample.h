#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "geo/geo.h"
#include "gtfs/gtfs.h"

namespace transitperf {

// One raw vehicle position as recorded by the ingestion store.
struct PositionSample {
  int64_t sample_id;
  std::string vehicle_id;
  GtfsRouteId route_id;
  // Trip the feed claims the vehicle is on. Not trusted for anything but
  // the fast path.
  std::optional<GtfsTripId> trip_id_hint;
  double lat;
  double lon;
  // Meters per second.
  std::optional<double> speed;
  std::optional<double> bearing;
  // Local wall-clock seconds since 1970-01-01 00:00.
  int64_t observed_at;
  // Deviation reported by the secondary vendor feed, positive when late.
  std::optional<int> reported_deviation_seconds;

  LatLon position() const { return LatLon{lat, lon}; }

  bool operator==(const PositionSample& other) const = default;
};

// Empty vehicle id, unusable coordinates or a negative speed.
bool IsValidSample(const PositionSample& sample);

}  // namespace transitperf
