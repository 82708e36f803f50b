#include "store/position_store.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace transitperf {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

PositionSample Sample(
    const std::string& vehicle, const std::string& route, int64_t observed_at
) {
  return PositionSample{
      .sample_id = 0,
      .vehicle_id = vehicle,
      .route_id = GtfsRouteId{route},
      .trip_id_hint = std::nullopt,
      .lat = 38.91,
      .lon = -77.0,
      .speed = std::nullopt,
      .bearing = std::nullopt,
      .observed_at = observed_at,
      .reported_deviation_seconds = std::nullopt,
  };
}

TEST(PositionStoreTest, LoadsRouteSamplesInTimeOrder) {
  PositionStore store(":memory:");

  PositionSample full = Sample("V1", "C51", 2000);
  full.trip_id_hint = GtfsTripId{"T1"};
  full.speed = 8.5;
  full.bearing = 270.0;
  full.reported_deviation_seconds = -45;
  store.Append({
      Sample("V2", "C51", 3000),
      full,
      Sample("V3", "X51", 2500),
      Sample("V4", "C51", 4000),
  });

  std::vector<PositionSample> samples =
      store.Load(GtfsRouteId{"C51"}, 1000, 4000);
  ASSERT_EQ(samples.size(), 2);

  EXPECT_EQ(samples[0].vehicle_id, "V1");
  EXPECT_EQ(samples[0].trip_id_hint, GtfsTripId{"T1"});
  EXPECT_EQ(samples[0].speed, 8.5);
  EXPECT_EQ(samples[0].bearing, 270.0);
  EXPECT_EQ(samples[0].reported_deviation_seconds, -45);
  EXPECT_EQ(samples[0].observed_at, 2000);
  EXPECT_GT(samples[0].sample_id, 0);

  EXPECT_EQ(samples[1].vehicle_id, "V2");
  EXPECT_EQ(samples[1].trip_id_hint, std::nullopt);
  EXPECT_EQ(samples[1].speed, std::nullopt);
  EXPECT_EQ(samples[1].reported_deviation_seconds, std::nullopt);
}

TEST(PositionStoreTest, ListsRoutesWithSamplesInRange) {
  PositionStore store(":memory:");
  store.Append({
      Sample("V1", "X51", 100),
      Sample("V2", "C51", 200),
      Sample("V3", "C51", 250),
      Sample("V4", "D80", 900),
  });

  EXPECT_THAT(
      store.RoutesWithSamples(0, 500),
      ElementsAre(GtfsRouteId{"C51"}, GtfsRouteId{"X51"})
  );
  EXPECT_THAT(store.RoutesWithSamples(1000, 2000), IsEmpty());
}

TEST(PositionStoreTest, OpenFailsOnUnwritablePath) {
  EXPECT_THROW(
      PositionStore("/nonexistent/transitperf/positions.db"), std::runtime_error
  );
}

}  // namespace
}  // namespace transitperf
