#include "matching/position_sample.h"

#include <cmath>

namespace transitperf {

bool IsValidSample(const PositionSample& sample) {
  if (sample.vehicle_id.empty()) {
    return false;
  }
  if (!IsValidLatLon(sample.position())) {
    return false;
  }
  if (sample.speed && (!std::isfinite(*sample.speed) || *sample.speed < 0.0)) {
    return false;
  }
  return true;
}

}  // namespace transitperf
