#pragma once

namespace transitperf {

// Samples farther than this from a trip's expected position get no distance
// credit.
constexpr double kMaxMatchDistanceMeters = 500.0;

// Lateness at which the time term reaches zero.
constexpr double kMaxLateSeconds = 15 * 60;

// Running more than this early costs an extra kEarlyPenalty.
constexpr double kEarlyGraceSeconds = 2 * 60;
constexpr double kEarlyPenalty = 0.3;

constexpr double kDistanceWeight = 0.5;
constexpr double kTimeWeight = 0.5;

// Fallback matches need a score strictly above this.
constexpr double kMatchThreshold = 0.3;

// 1 at the expected position, falling linearly to 0 at
// kMaxMatchDistanceMeters and beyond.
double DistanceTerm(double distance_meters);

// `deviation_seconds` is observed minus scheduled, positive when late. 1 at
// zero deviation, falling linearly with |deviation| to 0 at kMaxLateSeconds.
// More than kEarlyGraceSeconds early subtracts kEarlyPenalty.
double TimeTerm(double deviation_seconds);

// kDistanceWeight * distance_term + kTimeWeight * time_term, clamped to
// [0, 1].
double Score(double distance_term, double time_term);

inline bool IsConfident(double score) { return score > kMatchThreshold; }

}  // namespace transitperf
