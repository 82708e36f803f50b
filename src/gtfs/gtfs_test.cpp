#include "gtfs/gtfs.h"

#include <GUnit.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace transitperf;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::UnorderedElementsAre;

namespace {

// Writes a small feed with two routes. Service "wk" runs Mon-Fri in July
// 2025; "hol" only runs on 20250704 by exception, which also removes "wk".
std::string WriteSyntheticFeed(const std::string& name, bool with_shapes) {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  auto write = [&dir](const std::string& file, const std::string& contents) {
    std::ofstream out(dir / file);
    out << contents;
  };

  write(
      "routes.txt",
      "route_id,route_short_name,route_long_name\n"
      "C51,C51,\"Colesville Rd\"\n"
      "X51,X51,Crosstown\n"
  );
  write(
      "stops.txt",
      "stop_id,stop_name,stop_lat,stop_lon\n"
      "S1,First St,38.900000,-77.000000\n"
      "S2,Second St,38.910000,-77.000000\n"
      "S3,Third St,38.920000,-77.000000\n"
  );
  write(
      "trips.txt",
      with_shapes ? "route_id,service_id,trip_id,direction_id,shape_id\n"
                    "C51,wk,T1,0,SH1\n"
                    "C51,hol,T2,1,\n"
                    "X51,wk,T3,0,SH1\n"
                  : "route_id,service_id,trip_id\n"
                    "C51,wk,T1\n"
                    "C51,hol,T2\n"
                    "X51,wk,T3\n"
  );
  write(
      "stop_times.txt",
      "trip_id,arrival_time,departure_time,stop_id,stop_sequence\n"
      "T1,08:00:00,08:00:00,S1,1\n"
      "T1,08:10:00,08:10:30,S2,2\n"
      "T1,,,S3,3\n"
      "T2,7:05:00,7:05:00,S3,1\n"
      "T3,25:10:00,25:10:00,S1,1\n"
  );
  write(
      "calendar.txt",
      "service_id,monday,tuesday,wednesday,thursday,friday,saturday,sunday,"
      "start_date,end_date\n"
      "wk,1,1,1,1,1,0,0,20250701,20250731\n"
  );
  write(
      "calendar_dates.txt",
      "service_id,date,exception_type\n"
      "hol,20250704,1\n"
      "wk,20250704,2\n"
  );
  if (with_shapes) {
    write(
        "shapes.txt",
        "shape_id,shape_pt_lat,shape_pt_lon,shape_pt_sequence\n"
        "SH1,38.900000,-77.000000,1\n"
        "SH1,38.920000,-77.000000,2\n"
    );
  }
  return dir.string();
}

}  // namespace

GTEST("ParseGtfsTime accepts service-day times past midnight") {
  EXPECT_EQ(ParseGtfsTime("08:30:15").seconds, 8 * 3600 + 30 * 60 + 15);
  EXPECT_EQ(ParseGtfsTime("7:05:00").seconds, 7 * 3600 + 5 * 60);
  EXPECT_EQ(ParseGtfsTime("25:10:00").seconds, 25 * 3600 + 10 * 60);
  EXPECT_EQ(FormatGtfsTime(ParseGtfsTime("25:10:00")), "25:10:00");
}

GTEST("ParseGtfsTime rejects malformed times") {
  EXPECT_THROW(ParseGtfsTime("8:3:15"), std::runtime_error);
  EXPECT_THROW(ParseGtfsTime("08:30"), std::runtime_error);
  EXPECT_THROW(ParseGtfsTime("08:3a:15"), std::runtime_error);
  EXPECT_THROW(ParseGtfsTime("08:75:00"), std::runtime_error);
}

GTEST("GtfsLoad should read every file of a feed") {
  const Gtfs gtfs = GtfsLoad(WriteSyntheticFeed("transitperf_gtfs_load", true));

  EXPECT_EQ(gtfs.routes.size(), 2);
  EXPECT_THAT(
      gtfs.routes,
      Contains(AllOf(
          Field(&GtfsRoute::route_id, Field(&GtfsRouteId::v, Eq("C51"))),
          Field(&GtfsRoute::route_long_name, Eq("Colesville Rd"))
      ))
  );

  EXPECT_THAT(
      gtfs.stops,
      Contains(AllOf(
          Field(&GtfsStop::stop_id, Field(&GtfsStopId::v, Eq("S2"))),
          Field(&GtfsStop::stop_lat, DoubleNear(38.91, 1e-9)),
          Field(&GtfsStop::stop_lon, DoubleNear(-77.0, 1e-9))
      ))
  );

  EXPECT_THAT(
      gtfs.trips,
      Contains(AllOf(
          Field(&GtfsTrip::trip_id, Field(&GtfsTripId::v, Eq("T2"))),
          Field(&GtfsTrip::direction_id, Eq(1)),
          Field(&GtfsTrip::shape_id, Eq(std::nullopt))
      ))
  );
  EXPECT_THAT(
      gtfs.trips,
      Contains(AllOf(
          Field(&GtfsTrip::trip_id, Field(&GtfsTripId::v, Eq("T1"))),
          Field(&GtfsTrip::shape_id, Optional(Field(&GtfsShapeId::v, Eq("SH1"))))
      ))
  );

  // The untimed third stop of T1 is skipped.
  EXPECT_EQ(gtfs.stop_times.size(), 4);
  EXPECT_EQ(gtfs.malformed_stop_times, 0);
  ASSERT_EQ(gtfs.calendar.size(), 1);
  // Sunday first, then Monday through Saturday.
  EXPECT_THAT(
      gtfs.calendar[0].runs_on,
      ElementsAre(false, true, true, true, true, true, false)
  );
  EXPECT_EQ(gtfs.calendar_dates.size(), 2);
  EXPECT_EQ(gtfs.shapes.size(), 2);
}

GTEST("GtfsLoad should treat direction and shapes as optional") {
  const Gtfs gtfs =
      GtfsLoad(WriteSyntheticFeed("transitperf_gtfs_minimal", false));

  EXPECT_THAT(gtfs.shapes, IsEmpty());
  for (const auto& trip : gtfs.trips) {
    EXPECT_EQ(trip.direction_id, 0);
    EXPECT_EQ(trip.shape_id, std::nullopt);
  }
}

GTEST("GtfsLoad should skip and count stop times with malformed times") {
  const std::string dir =
      WriteSyntheticFeed("transitperf_gtfs_malformed_time", false);
  {
    std::ofstream out(
        std::filesystem::path(dir) / "stop_times.txt", std::ios::app
    );
    out << "T3,25:1x:00,25:10:00,S2,2\n"
        << "T3,25:20:00,25:20:00,S3,3\n";
  }

  const Gtfs gtfs = GtfsLoad(dir);

  EXPECT_EQ(gtfs.malformed_stop_times, 1);
  EXPECT_EQ(gtfs.stop_times.size(), 5);
  EXPECT_THAT(
      gtfs.stop_times,
      Contains(AllOf(
          Field(&GtfsStopTime::trip_id, Field(&GtfsTripId::v, Eq("T3"))),
          Field(&GtfsStopTime::stop_sequence, Eq(3))
      ))
  );
}

GTEST("GtfsLoad should fail on a missing directory") {
  EXPECT_THROW(
      GtfsLoad("/nonexistent/transitperf/feed"), std::runtime_error
  );
}

GTEST("GtfsFilterByDate keeps weekday service on a regular weekday") {
  const Gtfs gtfs =
      GtfsLoad(WriteSyntheticFeed("transitperf_gtfs_weekday", true));

  // Tuesday, July 8, 2025.
  const GtfsDay day = GtfsFilterByDate(gtfs, "20250708");

  EXPECT_EQ(day.date, "20250708");
  EXPECT_THAT(
      day.trips,
      UnorderedElementsAre(
          Field(&GtfsTrip::trip_id, Field(&GtfsTripId::v, Eq("T1"))),
          Field(&GtfsTrip::trip_id, Field(&GtfsTripId::v, Eq("T3")))
      )
  );
  EXPECT_EQ(day.routes.size(), 2);
  EXPECT_EQ(day.shapes.size(), 2);
  EXPECT_THAT(
      day.stops,
      UnorderedElementsAre(
          Field(&GtfsStop::stop_id, Field(&GtfsStopId::v, Eq("S1"))),
          Field(&GtfsStop::stop_id, Field(&GtfsStopId::v, Eq("S2")))
      )
  );
}

GTEST("GtfsFilterByDate applies calendar_dates exceptions") {
  const Gtfs gtfs =
      GtfsLoad(WriteSyntheticFeed("transitperf_gtfs_holiday", true));

  // Friday, July 4, 2025: "wk" is removed and "hol" is added.
  const GtfsDay day = GtfsFilterByDate(gtfs, "20250704");

  EXPECT_THAT(
      day.trips,
      ElementsAre(Field(&GtfsTrip::trip_id, Field(&GtfsTripId::v, Eq("T2"))))
  );
  EXPECT_THAT(
      day.routes,
      ElementsAre(Field(&GtfsRoute::route_id, Field(&GtfsRouteId::v, Eq("C51"))))
  );
  EXPECT_THAT(day.shapes, IsEmpty());
}

GTEST("GtfsFilterByDate has no service on a weekend") {
  const Gtfs gtfs =
      GtfsLoad(WriteSyntheticFeed("transitperf_gtfs_weekend", true));

  const GtfsDay day = GtfsFilterByDate(gtfs, "20250712");

  EXPECT_THAT(day.trips, IsEmpty());
  EXPECT_THAT(day.stop_times, IsEmpty());
  EXPECT_THAT(day.routes, IsEmpty());
}
