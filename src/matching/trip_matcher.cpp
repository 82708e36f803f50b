#include "matching/trip_matcher.h"

#include <cmath>
#include <limits>

#include "matching/confidence.h"

namespace transitperf {

std::string_view UnmatchedReasonName(UnmatchedReason reason) {
  switch (reason) {
    case UnmatchedReason::kLowConfidence:
      return "low_confidence";
    case UnmatchedReason::kNoCandidateTrips:
      return "no_candidate_trips";
    case UnmatchedReason::kInvalidSample:
      return "invalid_sample";
  }
  return "unknown";
}

namespace {

// The stop time at `stop_id` nearest in time to `offset`. Loop trips can
// serve a stop twice.
const ScheduledStopTime* ClosestStopTime(
    const ScheduledTrip& trip, const GtfsStopId& stop_id, double offset
) {
  const ScheduledStopTime* best = nullptr;
  for (const auto& stop_time : trip.stop_times) {
    if (stop_time.stop_id != stop_id) {
      continue;
    }
    if (best == nullptr || std::abs(stop_time.arrival_offset - offset) <
                               std::abs(best->arrival_offset - offset)) {
      best = &stop_time;
    }
  }
  return best;
}

double ProjectOntoTrip(const ScheduledTrip& trip, const LatLon& point) {
  auto projection = trip.path->ProjectBetween(
      point,
      trip.stop_times.front().distance_along,
      trip.stop_times.back().distance_along
  );
  return projection ? projection->distance_along : 0.0;
}

TripMatch MakeMatch(
    const PositionSample& sample,
    const ScheduleReference& schedule,
    const ScheduledTrip& trip,
    const NearestStop& stop,
    double confidence,
    double distance_along,
    bool used_fast_path
) {
  const double offset =
      static_cast<double>(sample.observed_at - schedule.day_start());
  std::optional<int> deviation;
  std::optional<int> stop_sequence;
  if (const ScheduledStopTime* stop_time =
          ClosestStopTime(trip, stop.stop_id, offset)) {
    deviation = static_cast<int>(
        sample.observed_at - (schedule.day_start() + stop_time->arrival_offset)
    );
    stop_sequence = stop_time->stop_sequence;
  }
  return TripMatch{
      .sample_ref = sample.sample_id,
      .trip_id = trip.trip_id,
      .stop_id = stop.stop_id,
      .confidence = confidence,
      .schedule_deviation_seconds = deviation,
      .stop_sequence = stop_sequence,
      .distance_to_stop_meters = stop.distance_meters,
      .distance_along = distance_along,
      .used_fast_path = used_fast_path,
  };
}

struct Candidate {
  const ScheduledTrip* trip;
  double score;
  double distance_along;
  double next_stop_meters;
};

// True if `a` should be preferred over `b`.
bool BetterCandidate(const Candidate& a, const Candidate& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.next_stop_meters != b.next_stop_meters) {
    return a.next_stop_meters < b.next_stop_meters;
  }
  return a.trip->trip_id < b.trip->trip_id;
}

}  // namespace

MatchResult MatchSample(
    const PositionSample& sample,
    const ScheduleReference& schedule,
    StopIndex& stop_index
) {
  if (!IsValidSample(sample)) {
    return Unmatched{sample.sample_id, UnmatchedReason::kInvalidSample};
  }

  const LatLon position = sample.position();
  std::optional<NearestStop> nearest =
      stop_index.Nearest(sample.route_id, position);
  if (!nearest) {
    return Unmatched{sample.sample_id, UnmatchedReason::kNoCandidateTrips};
  }

  // Fast path: a hint naming a trip of this route is trusted.
  if (sample.trip_id_hint) {
    const ScheduledTrip* hinted = schedule.FindTrip(*sample.trip_id_hint);
    if (hinted != nullptr && hinted->route_id == sample.route_id) {
      return MakeMatch(
          sample,
          schedule,
          *hinted,
          *nearest,
          1.0,
          ProjectOntoTrip(*hinted, position),
          true
      );
    }
  }

  const double offset =
      static_cast<double>(sample.observed_at - schedule.day_start());
  std::optional<Candidate> best;
  for (const ScheduledTrip* trip : schedule.TripsForRoute(sample.route_id)) {
    if (offset < trip->first_offset() - kCandidateWindowSeconds ||
        offset > trip->last_offset() + kCandidateWindowSeconds) {
      continue;
    }

    // Time-linear interpolation between stops, placed by path distance.
    const LatLon expected =
        trip->path->PointAt(trip->ExpectedDistanceAt(offset));
    const double distance_term =
        DistanceTerm(HaversineMeters(position, expected));

    const double along = ProjectOntoTrip(*trip, position);
    const double time_term = TimeTerm(offset - trip->ImpliedOffsetAt(along));

    const ScheduledStopTime* next_stop = trip->NextStopAt(along);
    double next_stop_meters = std::numeric_limits<double>::infinity();
    if (next_stop != nullptr) {
      const GtfsStop* stop = schedule.FindStop(next_stop->stop_id);
      next_stop_meters =
          HaversineMeters(position, LatLon{stop->stop_lat, stop->stop_lon});
    }

    Candidate candidate{
        trip, Score(distance_term, time_term), along, next_stop_meters
    };
    if (!best || BetterCandidate(candidate, *best)) {
      best = candidate;
    }
  }

  if (!best) {
    return Unmatched{sample.sample_id, UnmatchedReason::kNoCandidateTrips};
  }
  if (!IsConfident(best->score)) {
    return Unmatched{sample.sample_id, UnmatchedReason::kLowConfidence};
  }
  return MakeMatch(
      sample,
      schedule,
      *best->trip,
      *nearest,
      best->score,
      best->distance_along,
      false
  );
}

void PrintTo(const TripMatch& match, std::ostream* os) {
  *os << "TripMatch{sample " << match.sample_ref << ", ";
  PrintTo(match.trip_id, os);
  *os << ", ";
  PrintTo(match.stop_id, os);
  *os << ", confidence " << match.confidence << ", deviation ";
  if (match.schedule_deviation_seconds) {
    *os << *match.schedule_deviation_seconds;
  } else {
    *os << "nullopt";
  }
  *os << ", " << match.distance_to_stop_meters << "m from stop, "
      << match.distance_along << "m along"
      << (match.used_fast_path ? ", fast path" : "") << "}";
}

void PrintTo(const Unmatched& unmatched, std::ostream* os) {
  *os << "Unmatched{sample " << unmatched.sample_ref << ", "
      << UnmatchedReasonName(unmatched.reason) << "}";
}

}  // namespace transitperf
