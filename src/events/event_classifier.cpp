#include "events/event_classifier.h"

#include <algorithm>
#include <tuple>

#include "matching/stop_index.h"

namespace transitperf {

OtpClass ClassifyDeviation(int deviation_seconds) {
  if (deviation_seconds < kEarlyThresholdSeconds) {
    return OtpClass::kEarly;
  }
  if (deviation_seconds > kLateThresholdSeconds) {
    return OtpClass::kLate;
  }
  return OtpClass::kOnTime;
}

TimePeriod TimePeriodOf(int seconds_since_service_start) {
  const int hour = (seconds_since_service_start / 3600) % 24;
  if (hour < 6) {
    return TimePeriod::kNight;
  }
  if (hour < 9) {
    return TimePeriod::kAmPeak;
  }
  if (hour < 15) {
    return TimePeriod::kMidday;
  }
  if (hour < 19) {
    return TimePeriod::kPmPeak;
  }
  return TimePeriod::kEvening;
}

std::string_view TimePeriodName(TimePeriod period) {
  switch (period) {
    case TimePeriod::kNight:
      return "night";
    case TimePeriod::kAmPeak:
      return "am_peak";
    case TimePeriod::kMidday:
      return "midday";
    case TimePeriod::kPmPeak:
      return "pm_peak";
    case TimePeriod::kEvening:
      return "evening";
  }
  return "unknown";
}

namespace {

// A trip can serve the same stop twice, so the visit includes the sequence.
using VisitKey = std::tuple<std::string, GtfsTripId, GtfsStopId, int>;
using VehicleTripKey = std::pair<std::string, GtfsTripId>;

std::vector<ArrivalEvent> CollapseArrivals(
    const GtfsRouteId& route_id, const std::vector<MatchedSample>& matches
) {
  std::map<VisitKey, const MatchedSample*> closest;
  for (const auto& matched : matches) {
    const TripMatch& match = matched.match;
    if (!IsAtStop(match.distance_to_stop_meters) ||
        !match.schedule_deviation_seconds || !match.stop_sequence) {
      continue;
    }
    VisitKey key{
        matched.sample.vehicle_id,
        match.trip_id,
        match.stop_id,
        *match.stop_sequence,
    };
    auto [it, inserted] = closest.emplace(key, &matched);
    if (inserted) {
      continue;
    }
    const MatchedSample& current = *it->second;
    const double d = match.distance_to_stop_meters;
    const double current_d = current.match.distance_to_stop_meters;
    if (d < current_d ||
        (d == current_d &&
         matched.sample.observed_at < current.sample.observed_at)) {
      it->second = &matched;
    }
  }

  std::vector<ArrivalEvent> events;
  events.reserve(closest.size());
  for (const auto& [key, matched] : closest) {
    const int deviation = *matched->match.schedule_deviation_seconds;
    events.push_back(ArrivalEvent{
        .route_id = route_id,
        .stop_id = matched->match.stop_id,
        .trip_id = matched->match.trip_id,
        .vehicle_id = matched->sample.vehicle_id,
        .scheduled_time = matched->sample.observed_at - deviation,
        .observed_time = matched->sample.observed_at,
        .deviation_seconds = deviation,
        .classification = ClassifyDeviation(deviation),
        .distance_to_stop_meters = matched->match.distance_to_stop_meters,
    });
  }

  std::sort(
      events.begin(),
      events.end(),
      [](const ArrivalEvent& a, const ArrivalEvent& b) {
        return std::tie(a.stop_id, a.observed_time, a.vehicle_id, a.trip_id) <
               std::tie(b.stop_id, b.observed_time, b.vehicle_id, b.trip_id);
      }
  );
  return events;
}

void MeasureSpeeds(
    const std::vector<MatchedSample>& matches, ClassifiedSamples& result
) {
  std::map<VehicleTripKey, std::vector<const MatchedSample*>> by_vehicle_trip;
  for (const auto& matched : matches) {
    by_vehicle_trip[{matched.sample.vehicle_id, matched.match.trip_id}]
        .push_back(&matched);
  }

  const double max_meters_per_second = kMaxSpeedMph / kMetersPerSecondToMph;
  for (auto& [key, samples] : by_vehicle_trip) {
    std::stable_sort(
        samples.begin(),
        samples.end(),
        [](const MatchedSample* a, const MatchedSample* b) {
          return a->sample.observed_at < b->sample.observed_at;
        }
    );
    for (size_t i = 0; i + 1 < samples.size(); ++i) {
      const MatchedSample& from = *samples[i];
      const MatchedSample& to = *samples[i + 1];
      const int64_t elapsed = to.sample.observed_at - from.sample.observed_at;
      const double distance =
          to.match.distance_along - from.match.distance_along;
      if (elapsed <= 0 || distance < 0.0) {
        result.speed_outliers++;
        continue;
      }
      const double meters_per_second = distance / static_cast<double>(elapsed);
      if (meters_per_second > max_meters_per_second) {
        result.speed_outliers++;
        continue;
      }
      result.speeds.push_back(SpeedSample{
          .vehicle_id = key.first,
          .trip_id = key.second,
          .start_time = from.sample.observed_at,
          .end_time = to.sample.observed_at,
          .distance_meters = distance,
          .meters_per_second = meters_per_second,
      });
    }
  }
}

std::optional<double> Percent(int count, int total) {
  if (total == 0) {
    return std::nullopt;
  }
  return 100.0 * count / total;
}

}  // namespace

ClassifiedSamples ClassifyMatches(
    const GtfsRouteId& route_id,
    const ScheduleReference& schedule,
    const std::vector<MatchedSample>& matches
) {
  ClassifiedSamples result;
  result.events = CollapseArrivals(route_id, matches);

  // Speeds are measured along trips this schedule still knows about.
  std::vector<MatchedSample> measurable;
  for (const auto& matched : matches) {
    if (schedule.FindTrip(matched.match.trip_id) != nullptr) {
      measurable.push_back(matched);
    }
  }
  MeasureSpeeds(measurable, result);
  return result;
}

void OtpCounts::Add(OtpClass otp_class) {
  switch (otp_class) {
    case OtpClass::kEarly:
      early++;
      break;
    case OtpClass::kOnTime:
      on_time++;
      break;
    case OtpClass::kLate:
      late++;
      break;
  }
}

std::optional<double> OtpCounts::OnTimePercent() const {
  return Percent(on_time, total());
}

std::optional<double> OtpCounts::EarlyPercent() const {
  return Percent(early, total());
}

std::optional<double> OtpCounts::LatePercent() const {
  return Percent(late, total());
}

OtpBreakdown AggregateOtp(
    const std::vector<ArrivalEvent>& events, int64_t day_start
) {
  OtpBreakdown breakdown;
  for (const auto& event : events) {
    breakdown.line.Add(event.classification);
    breakdown.by_stop[event.stop_id].Add(event.classification);
    const TimePeriod period =
        TimePeriodOf(static_cast<int>(event.scheduled_time - day_start));
    breakdown.by_period[period].Add(event.classification);
  }
  return breakdown;
}

std::vector<VendorObservation> ClassifyVendorDeviations(
    const std::vector<PositionSample>& samples
) {
  std::vector<VendorObservation> observations;
  for (const auto& sample : samples) {
    if (!sample.reported_deviation_seconds || !IsValidSample(sample)) {
      continue;
    }
    const int deviation = *sample.reported_deviation_seconds;
    observations.push_back(VendorObservation{
        .sample_ref = sample.sample_id,
        .vehicle_id = sample.vehicle_id,
        .deviation_seconds = deviation,
        .classification = ClassifyDeviation(deviation),
    });
  }
  return observations;
}

}  // namespace transitperf
