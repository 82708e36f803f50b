#include "matching/confidence.h"

#include <algorithm>
#include <cmath>

namespace transitperf {

double DistanceTerm(double distance_meters) {
  const double d = std::clamp(distance_meters, 0.0, kMaxMatchDistanceMeters);
  return 1.0 - d / kMaxMatchDistanceMeters;
}

double TimeTerm(double deviation_seconds) {
  double term = 1.0 - std::min(std::abs(deviation_seconds), kMaxLateSeconds) /
                          kMaxLateSeconds;
  if (deviation_seconds < -kEarlyGraceSeconds) {
    term -= kEarlyPenalty;
  }
  return std::max(term, 0.0);
}

double Score(double distance_term, double time_term) {
  return std::clamp(
      kDistanceWeight * distance_term + kTimeWeight * time_term, 0.0, 1.0
  );
}

}  // namespace transitperf
