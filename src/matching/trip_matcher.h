#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "gtfs/gtfs.h"
#include "matching/position_sample.h"
#include "matching/stop_index.h"
#include "schedule/schedule_reference.h"

namespace transitperf {

// Fallback candidates are trips in service within this window of the sample.
constexpr int kCandidateWindowSeconds = 15 * 60;

struct TripMatch {
  int64_t sample_ref;
  GtfsTripId trip_id;
  // Nearest stop of the sample's route.
  GtfsStopId stop_id;
  double confidence;
  // Observed minus scheduled time at `stop_id`, present only when the trip
  // serves that stop.
  std::optional<int> schedule_deviation_seconds;
  // The stop time the deviation was measured against. Loop trips serve a
  // stop more than once, so this tells the visits apart.
  std::optional<int> stop_sequence;
  double distance_to_stop_meters;
  // Where the sample projects onto the trip's path.
  double distance_along;
  bool used_fast_path;

  bool operator==(const TripMatch& other) const = default;
};

enum class UnmatchedReason { kLowConfidence, kNoCandidateTrips, kInvalidSample };

std::string_view UnmatchedReasonName(UnmatchedReason reason);

struct Unmatched {
  int64_t sample_ref;
  UnmatchedReason reason;

  bool operator==(const Unmatched& other) const = default;
};

using MatchResult = std::variant<TripMatch, Unmatched>;

// Assigns `sample` to a scheduled trip of its route and the nearest stop.
//
// A trip hint that resolves to a trip of the sample's route is accepted as is
// with confidence 1.0. Otherwise every trip in service within
// kCandidateWindowSeconds of the sample is scored on its distance from the
// trip's expected position and on how far the sample's position along the
// path is from schedule; the best score must pass IsConfident. Equal scores
// prefer the trip whose next stop is nearest, then the smaller trip id.
MatchResult MatchSample(
    const PositionSample& sample,
    const ScheduleReference& schedule,
    StopIndex& stop_index
);

void PrintTo(const TripMatch& match, std::ostream* os);
void PrintTo(const Unmatched& unmatched, std::ostream* os);

}  // namespace transitperf
