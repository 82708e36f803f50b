#include "geo/geo.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace transitperf {

namespace {

double ToRadians(double degrees) { return degrees * std::numbers::pi / 180.0; }

}  // namespace

double HaversineMeters(const LatLon& a, const LatLon& b) {
  const double phi1 = ToRadians(a.lat);
  const double phi2 = ToRadians(b.lat);
  const double dphi = ToRadians(b.lat - a.lat);
  const double dlambda = ToRadians(b.lon - a.lon);

  const double s = std::sin(dphi / 2) * std::sin(dphi / 2) +
                   std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2) *
                       std::sin(dlambda / 2);
  const double c = 2 * std::atan2(std::sqrt(s), std::sqrt(1 - s));
  return kEarthRadiusMeters * c;
}

bool IsValidLatLon(const LatLon& p) {
  return std::isfinite(p.lat) && std::isfinite(p.lon) && p.lat >= -90.0 &&
         p.lat <= 90.0 && p.lon >= -180.0 && p.lon <= 180.0;
}

Polyline::Polyline(std::vector<LatLon> points) : points_(std::move(points)) {
  cumulative_meters_.reserve(points_.size());
  double total = 0.0;
  for (size_t i = 0; i < points_.size(); ++i) {
    if (i > 0) {
      total += HaversineMeters(points_[i - 1], points_[i]);
    }
    cumulative_meters_.push_back(total);
  }
}

std::optional<PolylineProjection> Polyline::ProjectBetween(
    const LatLon& p, double min_along, double max_along
) const {
  if (points_.empty()) {
    return std::nullopt;
  }
  if (points_.size() == 1) {
    return PolylineProjection{0.0, HaversineMeters(p, points_[0])};
  }

  std::optional<PolylineProjection> best;
  for (size_t i = 0; i + 1 < points_.size(); ++i) {
    const double seg_start = cumulative_meters_[i];
    const double seg_end = cumulative_meters_[i + 1];
    if (seg_end < min_along || seg_start > max_along) {
      continue;
    }

    // Local frame centered on the segment start, in meters.
    const LatLon& a = points_[i];
    const LatLon& b = points_[i + 1];
    const double meters_per_deg_lat = kEarthRadiusMeters * std::numbers::pi / 180.0;
    const double meters_per_deg_lon =
        meters_per_deg_lat * std::cos(ToRadians(a.lat));
    const double bx = (b.lon - a.lon) * meters_per_deg_lon;
    const double by = (b.lat - a.lat) * meters_per_deg_lat;
    const double px = (p.lon - a.lon) * meters_per_deg_lon;
    const double py = (p.lat - a.lat) * meters_per_deg_lat;

    const double len2 = bx * bx + by * by;
    double t = len2 > 0.0 ? (px * bx + py * by) / len2 : 0.0;
    t = std::clamp(t, 0.0, 1.0);

    double along = seg_start + t * (seg_end - seg_start);
    along = std::clamp(along, min_along, max_along);
    const LatLon closest = PointAt(along);
    const double offset = HaversineMeters(p, closest);
    if (!best || offset < best->offset) {
      best = PolylineProjection{along, offset};
    }
  }
  return best;
}

LatLon Polyline::PointAt(double distance) const {
  if (points_.empty()) {
    return LatLon{0.0, 0.0};
  }
  if (distance <= 0.0) {
    return points_.front();
  }
  if (distance >= length_meters()) {
    return points_.back();
  }

  // First cumulative distance strictly greater than `distance`.
  auto it = std::upper_bound(
      cumulative_meters_.begin(), cumulative_meters_.end(), distance
  );
  const size_t i = static_cast<size_t>(it - cumulative_meters_.begin());
  const double seg_start = cumulative_meters_[i - 1];
  const double seg_len = cumulative_meters_[i] - seg_start;
  const double t = seg_len > 0.0 ? (distance - seg_start) / seg_len : 0.0;
  const LatLon& a = points_[i - 1];
  const LatLon& b = points_[i];
  return LatLon{a.lat + t * (b.lat - a.lat), a.lon + t * (b.lon - a.lon)};
}

}  // namespace transitperf
