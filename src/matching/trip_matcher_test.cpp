#include "matching/trip_matcher.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_util/synthetic_gtfs.h"
#include "util/date.h"

namespace transitperf {
namespace {

constexpr char kDay[] = "20250708";

PositionSample MakeSample(
    int64_t id,
    const std::string& route_id,
    std::optional<std::string> hint,
    double lat,
    double lon,
    const std::string& time
) {
  PositionSample sample{
      .sample_id = id,
      .vehicle_id = "V1",
      .route_id = GtfsRouteId{route_id},
      .trip_id_hint = std::nullopt,
      .lat = lat,
      .lon = lon,
      .speed = std::nullopt,
      .bearing = std::nullopt,
      .observed_at = DayStartTimestamp(kDay) + ParseGtfsTime(time).seconds,
      .reported_deviation_seconds = std::nullopt,
  };
  if (hint) {
    sample.trip_id_hint = GtfsTripId{*hint};
  }
  return sample;
}

class TripMatcherTest : public ::testing::Test {
 protected:
  TripMatcherTest()
      : schedule_(MakeCorridorDay(kDay), NullLogger()), index_(schedule_) {}

  MatchResult Match(const PositionSample& sample) {
    return MatchSample(sample, schedule_, index_);
  }

  ScheduleReference schedule_;
  StopIndex index_;
};

TEST_F(TripMatcherTest, FastPathAcceptsHintedTrip) {
  MatchResult result =
      Match(MakeSample(1, "C51", "T1", 38.9101, -77.0, "08:12:00"));

  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  const TripMatch& match = std::get<TripMatch>(result);
  EXPECT_EQ(match.sample_ref, 1);
  EXPECT_EQ(match.trip_id, GtfsTripId{"T1"});
  EXPECT_EQ(match.stop_id, GtfsStopId{"S1"});
  EXPECT_DOUBLE_EQ(match.confidence, 1.0);
  EXPECT_TRUE(match.used_fast_path);
  EXPECT_EQ(match.schedule_deviation_seconds, 120);
  EXPECT_NEAR(match.distance_to_stop_meters, 11.12, 0.01);
}

TEST_F(TripMatcherTest, FastPathSkipsPlausibilityChecks) {
  // Far from the corridor and hours off schedule, but the hint is trusted.
  MatchResult result =
      Match(MakeSample(2, "C51", "T2", 38.95, -77.02, "13:00:00"));

  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  const TripMatch& match = std::get<TripMatch>(result);
  EXPECT_EQ(match.trip_id, GtfsTripId{"T2"});
  EXPECT_DOUBLE_EQ(match.confidence, 1.0);
  EXPECT_TRUE(match.used_fast_path);
}

TEST_F(TripMatcherTest, HintOnAnotherRouteFallsBack) {
  MatchResult result =
      Match(MakeSample(3, "C51", "T9", 38.910, -77.0, "08:10:00"));

  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  const TripMatch& match = std::get<TripMatch>(result);
  EXPECT_EQ(match.trip_id, GtfsTripId{"T1"});
  EXPECT_FALSE(match.used_fast_path);
}

TEST_F(TripMatcherTest, UnknownHintFallsBack) {
  MatchResult result =
      Match(MakeSample(4, "C51", "NOPE", 38.910, -77.0, "08:28:00"));

  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  const TripMatch& match = std::get<TripMatch>(result);
  EXPECT_EQ(match.trip_id, GtfsTripId{"T2"});
  EXPECT_FALSE(match.used_fast_path);
  EXPECT_NEAR(match.confidence, 1.0, 1e-3);
  EXPECT_EQ(match.schedule_deviation_seconds, 0);
}

TEST_F(TripMatcherTest, FallbackPicksTripOnSchedule) {
  MatchResult result =
      Match(MakeSample(5, "C51", std::nullopt, 38.910, -77.0, "08:10:00"));

  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  const TripMatch& match = std::get<TripMatch>(result);
  EXPECT_EQ(match.trip_id, GtfsTripId{"T1"});
  EXPECT_EQ(match.stop_id, GtfsStopId{"S1"});
  EXPECT_GT(match.confidence, 0.99);
  EXPECT_EQ(match.schedule_deviation_seconds, 0);
}

TEST_F(TripMatcherTest, FallbackBelowThresholdIsLowConfidence) {
  // At S1 at 08:21: T1 should be at S2 and T2 between S0 and S1.
  MatchResult result =
      Match(MakeSample(6, "C51", std::nullopt, 38.910, -77.0, "08:21:00"));

  ASSERT_TRUE(std::holds_alternative<Unmatched>(result));
  EXPECT_EQ(
      std::get<Unmatched>(result),
      (Unmatched{6, UnmatchedReason::kLowConfidence})
  );
}

TEST_F(TripMatcherTest, NoTripsInWindowIsNoCandidate) {
  MatchResult result =
      Match(MakeSample(7, "C51", std::nullopt, 38.910, -77.0, "12:00:00"));

  EXPECT_EQ(
      std::get<Unmatched>(result),
      (Unmatched{7, UnmatchedReason::kNoCandidateTrips})
  );
}

TEST_F(TripMatcherTest, RouteWithoutStopsIsNoCandidate) {
  MatchResult result =
      Match(MakeSample(8, "X51", std::nullopt, 38.910, -77.0, "08:10:00"));

  EXPECT_EQ(
      std::get<Unmatched>(result),
      (Unmatched{8, UnmatchedReason::kNoCandidateTrips})
  );
}

TEST_F(TripMatcherTest, InvalidSamplesAreRejected) {
  PositionSample no_vehicle =
      MakeSample(9, "C51", "T1", 38.910, -77.0, "08:10:00");
  no_vehicle.vehicle_id = "";
  EXPECT_EQ(
      std::get<Unmatched>(Match(no_vehicle)),
      (Unmatched{9, UnmatchedReason::kInvalidSample})
  );

  PositionSample bad_lat = MakeSample(10, "C51", "T1", 95.0, -77.0, "08:10:00");
  EXPECT_EQ(
      std::get<Unmatched>(Match(bad_lat)),
      (Unmatched{10, UnmatchedReason::kInvalidSample})
  );

  PositionSample bad_speed =
      MakeSample(11, "C51", "T1", 38.910, -77.0, "08:10:00");
  bad_speed.speed = -3.0;
  EXPECT_EQ(
      std::get<Unmatched>(Match(bad_speed)),
      (Unmatched{11, UnmatchedReason::kInvalidSample})
  );
}

TEST_F(TripMatcherTest, ConfidenceNonDecreasingAsSampleApproachesTrip) {
  // T1 is expected midway between S1 and S2 at 08:15. Samples approach that
  // point from the east.
  std::vector<double> lon_offsets = {0.004, 0.003, 0.002, 0.001, 0.0005, 0.0};
  double previous = 0.0;
  for (double lon_offset : lon_offsets) {
    MatchResult result = Match(MakeSample(
        12, "C51", std::nullopt, 38.915, -77.0 + lon_offset, "08:15:00"
    ));
    ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
    const TripMatch& match = std::get<TripMatch>(result);
    EXPECT_EQ(match.trip_id, GtfsTripId{"T1"});
    EXPECT_GE(match.confidence, previous);
    previous = match.confidence;
  }
  EXPECT_NEAR(previous, 1.0, 1e-3);
}

TEST(TripMatcherTieTest, EqualScoresPreferSmallerTripId) {
  GtfsDay day = GtfsDayBuilder(kDay)
                    .AddStop("A", 38.900, -77.0)
                    .AddStop("B", 38.910, -77.0)
                    .AddRoute("R")
                    .AddTrip("R", "TB", 0, {{"A", "10:00:00"}, {"B", "10:10:00"}})
                    .AddTrip("R", "TA", 0, {{"A", "10:00:00"}, {"B", "10:10:00"}})
                    .Build();
  ScheduleReference schedule(day, NullLogger());
  StopIndex index(schedule);

  MatchResult result = MatchSample(
      MakeSample(13, "R", std::nullopt, 38.905, -77.0, "10:05:00"),
      schedule,
      index
  );
  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  EXPECT_EQ(std::get<TripMatch>(result).trip_id, GtfsTripId{"TA"});
}

TEST(TripMatcherTieTest, EqualScoresPreferNearerNextStop) {
  // B2 sits east of the shape's end, so it projects to the same distance
  // along as B and both trips score the same.
  GtfsDay day = GtfsDayBuilder(kDay)
                    .AddStop("A", 38.900, -77.0)
                    .AddStop("B", 38.920, -77.0)
                    .AddStop("B2", 38.920, -76.9996)
                    .AddRoute("R")
                    .AddShape("SH", {{38.900, -77.0}, {38.920, -77.0}})
                    .AddTrip(
                        "R", "T1", 0, {{"A", "10:00:00"}, {"B2", "10:10:00"}}, "SH"
                    )
                    .AddTrip(
                        "R", "T2", 0, {{"A", "10:00:00"}, {"B", "10:10:00"}}, "SH"
                    )
                    .Build();
  ScheduleReference schedule(day, NullLogger());
  StopIndex index(schedule);

  MatchResult result = MatchSample(
      MakeSample(15, "R", std::nullopt, 38.910, -77.0, "10:05:00"),
      schedule,
      index
  );
  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  EXPECT_EQ(std::get<TripMatch>(result).trip_id, GtfsTripId{"T2"});
}

class TripMatcherThresholdTest : public ::testing::Test {
 protected:
  TripMatcherThresholdTest()
      : schedule_(
            GtfsDayBuilder(kDay)
                .AddStop("A", 38.900, -77.0)
                .AddStop("B", 38.910, -77.0)
                .AddRoute("R")
                .AddTrip("R", "T", 0, {{"A", "10:00:00"}, {"B", "10:10:00"}})
                .Build(),
            NullLogger()
        ),
        index_(schedule_) {}

  // About 600 m past the last stop, so the distance term is 0 and the score
  // is half the time term for the lateness against B.
  MatchResult MatchPastTerminal(const std::string& time) {
    return MatchSample(
        MakeSample(16, "R", std::nullopt, 38.9155, -77.0, time),
        schedule_,
        index_
    );
  }

  ScheduleReference schedule_;
  StopIndex index_;
};

TEST_F(TripMatcherThresholdTest, ScoreOfExactlyThresholdIsUnmatched) {
  // 360 s late: time term 0.6, score 0.3.
  MatchResult result = MatchPastTerminal("10:16:00");
  ASSERT_TRUE(std::holds_alternative<Unmatched>(result));
  EXPECT_EQ(
      std::get<Unmatched>(result).reason, UnmatchedReason::kLowConfidence
  );
}

TEST_F(TripMatcherThresholdTest, ScoreJustAboveThresholdMatches) {
  // 342 s late: time term 0.62, score 0.31.
  MatchResult result = MatchPastTerminal("10:15:42");
  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  const TripMatch& match = std::get<TripMatch>(result);
  EXPECT_EQ(match.trip_id, GtfsTripId{"T"});
  EXPECT_NEAR(match.confidence, 0.31, 1e-9);
  EXPECT_FALSE(match.used_fast_path);
}

TEST(TripMatcherDeviationTest, NoDeviationWhenTripSkipsNearestStop) {
  GtfsDay day = GtfsDayBuilder(kDay)
                    .AddStop("A", 38.900, -77.0)
                    .AddStop("B", 38.910, -77.0)
                    .AddStop("C", 38.920, -77.0)
                    .AddRoute("R")
                    .AddTrip(
                        "R",
                        "LONG",
                        0,
                        {{"A", "10:00:00"}, {"B", "10:10:00"}, {"C", "10:20:00"}}
                    )
                    .AddTrip("R", "SHORT", 0, {{"A", "10:00:00"}, {"B", "10:10:00"}})
                    .Build();
  ScheduleReference schedule(day, NullLogger());
  StopIndex index(schedule);

  MatchResult result = MatchSample(
      MakeSample(14, "R", "SHORT", 38.920, -77.0, "10:12:00"), schedule, index
  );
  ASSERT_TRUE(std::holds_alternative<TripMatch>(result));
  const TripMatch& match = std::get<TripMatch>(result);
  EXPECT_EQ(match.stop_id, GtfsStopId{"C"});
  EXPECT_EQ(match.schedule_deviation_seconds, std::nullopt);
}

}  // namespace
}  // namespace transitperf
