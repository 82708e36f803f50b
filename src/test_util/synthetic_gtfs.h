#pragma once

#include <string>
#include <utility>
#include <vector>

#include "gtfs/gtfs.h"

namespace transitperf {

// Builds small in-memory service days for tests.
class GtfsDayBuilder {
 public:
  explicit GtfsDayBuilder(std::string date);

  GtfsDayBuilder& AddStop(const std::string& stop_id, double lat, double lon);
  GtfsDayBuilder& AddRoute(const std::string& route_id);

  // `stop_times` are (stop_id, "HH:MM:SS") pairs in sequence order.
  GtfsDayBuilder& AddTrip(
      const std::string& route_id,
      const std::string& trip_id,
      int direction_id,
      const std::vector<std::pair<std::string, std::string>>& stop_times,
      const std::string& shape_id = ""
  );

  // Points in sequence order.
  GtfsDayBuilder& AddShape(
      const std::string& shape_id,
      const std::vector<std::pair<double, double>>& points
  );

  GtfsDay Build() const { return day_; }

 private:
  GtfsDay day_;
};

// A feed whose single service "svc" runs every day from `start_date` to
// `end_date` with the contents of `day`.
Gtfs FeedFromDay(
    const GtfsDay& day, const std::string& start_date, const std::string& end_date
);

// Route "C51" running north along longitude -77.0 through stops S0, S1 and S2,
// about 1.1 km apart. Trip T1 leaves S0 at 08:00 and T2 at 08:18, each taking
// 10 minutes between stops. Route "C52" shares no stops and has trip T9.
GtfsDay MakeCorridorDay(const std::string& date = "20250708");

}  // namespace transitperf
