#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "gtfs/gtfs.h"
#include "matching/position_sample.h"
#include "store/sqlite_wrapper.h"

namespace transitperf {

// The vehicle_positions table written by the ingestion collector. Reads are
// serialized on one connection so workers can share a store.
class PositionStore {
 public:
  // Opens `path`, creating the table and its index if missing.
  explicit PositionStore(const std::string& path);

  // Appends samples, assigning fresh sample ids. Used by collectors and
  // tests.
  void Append(const std::vector<PositionSample>& samples);

  // Samples of `route_id` observed in [start, end), ordered by observed_at
  // then id.
  std::vector<PositionSample> Load(
      const GtfsRouteId& route_id, int64_t start, int64_t end
  );

  // Distinct routes with samples observed in [start, end), sorted.
  std::vector<GtfsRouteId> RoutesWithSamples(int64_t start, int64_t end);

 private:
  std::mutex mutex_;
  SqliteDb db_;
};

}  // namespace transitperf
