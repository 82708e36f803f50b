#include "test_util/synthetic_gtfs.h"

namespace transitperf {

GtfsDayBuilder::GtfsDayBuilder(std::string date) { day_.date = std::move(date); }

GtfsDayBuilder& GtfsDayBuilder::AddStop(
    const std::string& stop_id, double lat, double lon
) {
  day_.stops.push_back(GtfsStop{
      .stop_id = GtfsStopId{stop_id},
      .stop_name = "Stop " + stop_id,
      .stop_lat = lat,
      .stop_lon = lon,
  });
  return *this;
}

GtfsDayBuilder& GtfsDayBuilder::AddRoute(const std::string& route_id) {
  day_.routes.push_back(GtfsRoute{
      .route_id = GtfsRouteId{route_id},
      .route_short_name = route_id,
      .route_long_name = "",
  });
  return *this;
}

GtfsDayBuilder& GtfsDayBuilder::AddTrip(
    const std::string& route_id,
    const std::string& trip_id,
    int direction_id,
    const std::vector<std::pair<std::string, std::string>>& stop_times,
    const std::string& shape_id
) {
  GtfsTrip trip{
      .route_id = GtfsRouteId{route_id},
      .direction_id = direction_id,
      .trip_id = GtfsTripId{trip_id},
      .service_id = GtfsServiceId{"svc"},
      .shape_id = std::nullopt,
  };
  if (!shape_id.empty()) {
    trip.shape_id = GtfsShapeId{shape_id};
  }
  day_.trips.push_back(std::move(trip));

  int sequence = 1;
  for (const auto& [stop_id, time] : stop_times) {
    day_.stop_times.push_back(GtfsStopTime{
        .trip_id = GtfsTripId{trip_id},
        .stop_id = GtfsStopId{stop_id},
        .stop_sequence = sequence++,
        .arrival_time = ParseGtfsTime(time),
        .departure_time = ParseGtfsTime(time),
    });
  }
  return *this;
}

GtfsDayBuilder& GtfsDayBuilder::AddShape(
    const std::string& shape_id,
    const std::vector<std::pair<double, double>>& points
) {
  int sequence = 1;
  for (const auto& [lat, lon] : points) {
    day_.shapes.push_back(GtfsShapePoint{
        .shape_id = GtfsShapeId{shape_id},
        .shape_pt_lat = lat,
        .shape_pt_lon = lon,
        .shape_pt_sequence = sequence++,
    });
  }
  return *this;
}

Gtfs FeedFromDay(
    const GtfsDay& day, const std::string& start_date, const std::string& end_date
) {
  Gtfs gtfs;
  gtfs.stops = day.stops;
  gtfs.trips = day.trips;
  gtfs.stop_times = day.stop_times;
  gtfs.routes = day.routes;
  gtfs.shapes = day.shapes;
  gtfs.calendar.push_back(GtfsCalendar{
      .service_id = GtfsServiceId{"svc"},
      .runs_on = {true, true, true, true, true, true, true},
      .start_date = start_date,
      .end_date = end_date,
  });
  return gtfs;
}

GtfsDay MakeCorridorDay(const std::string& date) {
  return GtfsDayBuilder(date)
      .AddStop("S0", 38.900, -77.0)
      .AddStop("S1", 38.910, -77.0)
      .AddStop("S2", 38.920, -77.0)
      .AddStop("E0", 38.800, -77.1)
      .AddStop("E1", 38.810, -77.1)
      .AddRoute("C51")
      .AddRoute("C52")
      .AddTrip(
          "C51",
          "T1",
          0,
          {{"S0", "08:00:00"}, {"S1", "08:10:00"}, {"S2", "08:20:00"}}
      )
      .AddTrip(
          "C51",
          "T2",
          0,
          {{"S0", "08:18:00"}, {"S1", "08:28:00"}, {"S2", "08:38:00"}}
      )
      .AddTrip("C52", "T9", 0, {{"E0", "09:00:00"}, {"E1", "09:10:00"}})
      .Build();
}

}  // namespace transitperf
