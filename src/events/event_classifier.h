#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gtfs/gtfs.h"
#include "matching/position_sample.h"
#include "matching/trip_matcher.h"
#include "schedule/schedule_reference.h"

namespace transitperf {

// Deviations in [kEarlyThresholdSeconds, kLateThresholdSeconds] are on time.
constexpr int kEarlyThresholdSeconds = -60;
constexpr int kLateThresholdSeconds = 300;

constexpr double kMetersPerSecondToMph = 2.23694;
constexpr double kMaxSpeedMph = 70.0;

enum class OtpClass { kEarly, kOnTime, kLate };

OtpClass ClassifyDeviation(int deviation_seconds);

// Buckets of the scheduled time of day.
enum class TimePeriod { kNight, kAmPeak, kMidday, kPmPeak, kEvening };

// Night 00-06, AM Peak 06-09, Midday 09-15, PM Peak 15-19, Evening 19-24.
// Offsets past 24:00 wrap around.
TimePeriod TimePeriodOf(int seconds_since_service_start);
std::string_view TimePeriodName(TimePeriod period);

struct MatchedSample {
  PositionSample sample;
  TripMatch match;
};

struct ArrivalEvent {
  GtfsRouteId route_id;
  GtfsStopId stop_id;
  GtfsTripId trip_id;
  std::string vehicle_id;
  int64_t scheduled_time;
  // Timestamp of the closest-approach sample.
  int64_t observed_time;
  int deviation_seconds;
  OtpClass classification;
  double distance_to_stop_meters;

  bool operator==(const ArrivalEvent& other) const = default;
};

struct SpeedSample {
  std::string vehicle_id;
  GtfsTripId trip_id;
  int64_t start_time;
  int64_t end_time;
  double distance_meters;
  double meters_per_second;

  double mph() const { return meters_per_second * kMetersPerSecondToMph; }
};

struct ClassifiedSamples {
  // Sorted by stop, observed time, vehicle and trip.
  std::vector<ArrivalEvent> events;
  std::vector<SpeedSample> speeds;
  // Pairs dropped for non-positive elapsed time, backwards progress or
  // implausible speed.
  int speed_outliers = 0;
};

// Turns one route-day of matches into arrival events and speed samples.
//
// Every at-stop match whose trip serves the matched stop is a candidate
// arrival; the candidates of one (vehicle, trip, stop time) visit collapse into the
// closest-approach sample, earlier on ties. Speeds come from consecutive
// samples of one vehicle on one trip, measured along the trip's path.
ClassifiedSamples ClassifyMatches(
    const GtfsRouteId& route_id,
    const ScheduleReference& schedule,
    const std::vector<MatchedSample>& matches
);

struct OtpCounts {
  int early = 0;
  int on_time = 0;
  int late = 0;

  void Add(OtpClass otp_class);
  int total() const { return early + on_time + late; }

  // nullopt when there is nothing to measure.
  std::optional<double> OnTimePercent() const;
  std::optional<double> EarlyPercent() const;
  std::optional<double> LatePercent() const;

  bool operator==(const OtpCounts& other) const = default;
};

struct OtpBreakdown {
  OtpCounts line;
  std::map<GtfsStopId, OtpCounts> by_stop;
  std::map<TimePeriod, OtpCounts> by_period;
};

// Line, stop and scheduled-time-period OTP over `events`.
OtpBreakdown AggregateOtp(
    const std::vector<ArrivalEvent>& events, int64_t day_start
);

// A sample's deviation as reported by the secondary vendor feed.
struct VendorObservation {
  int64_t sample_ref;
  std::string vehicle_id;
  int deviation_seconds;
  OtpClass classification;
};

// Classifies the vendor-reported deviations of valid samples with the same
// thresholds as arrival events. Kept apart from arrival events and only used
// to cross-check them.
std::vector<VendorObservation> ClassifyVendorDeviations(
    const std::vector<PositionSample>& samples
);

}  // namespace transitperf
