#pragma once

#include <optional>
#include <vector>

namespace transitperf {

constexpr double kEarthRadiusMeters = 6371000.0;

struct LatLon {
  double lat;
  double lon;

  bool operator==(const LatLon& other) const {
    return lat == other.lat && lon == other.lon;
  }
};

// Great-circle distance in meters.
double HaversineMeters(const LatLon& a, const LatLon& b);

// True for finite coordinates within [-90, 90] x [-180, 180].
bool IsValidLatLon(const LatLon& p);

struct PolylineProjection {
  // Meters along the polyline of the closest point.
  double distance_along;
  // Meters from the input point to the closest point.
  double offset;
};

// A polyline with precomputed cumulative distances.
class Polyline {
 public:
  Polyline() = default;
  explicit Polyline(std::vector<LatLon> points);

  const std::vector<LatLon>& points() const { return points_; }
  const std::vector<double>& cumulative_meters() const {
    return cumulative_meters_;
  }
  double length_meters() const {
    return cumulative_meters_.empty() ? 0.0 : cumulative_meters_.back();
  }
  bool empty() const { return points_.empty(); }

  // Closest point to `p` on the stretch of the polyline between `min_along`
  // and `max_along`. nullopt for an empty polyline. Segments are projected in
  // a local equirectangular frame, which is accurate to well under a meter at
  // segment scale.
  std::optional<PolylineProjection> ProjectBetween(
      const LatLon& p, double min_along, double max_along
  ) const;

  // The point `distance` meters along the polyline, clamped to its ends.
  LatLon PointAt(double distance) const;

 private:
  std::vector<LatLon> points_;
  std::vector<double> cumulative_meters_;
};

}  // namespace transitperf
