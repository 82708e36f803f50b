#pragma once

#include <array>
#include <compare>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace transitperf {

// Typed ids keep stop, route, trip, service and shape ids from being mixed up.
struct GtfsStopId {
  std::string v;

  auto operator<=>(const GtfsStopId& other) const = default;
};

struct GtfsRouteId {
  std::string v;

  auto operator<=>(const GtfsRouteId& other) const = default;
};

struct GtfsTripId {
  std::string v;

  auto operator<=>(const GtfsTripId& other) const = default;
};

struct GtfsServiceId {
  std::string v;

  auto operator<=>(const GtfsServiceId& other) const = default;
};

struct GtfsShapeId {
  std::string v;

  auto operator<=>(const GtfsShapeId& other) const = default;
};

// Seconds after midnight of the service day. May exceed 24h for trips that
// run past midnight.
struct GtfsTimeSinceServiceStart {
  int seconds;

  auto operator<=>(const GtfsTimeSinceServiceStart& other) const = default;
};

struct GtfsStop {
  GtfsStopId stop_id;
  std::string stop_name;
  double stop_lat;
  double stop_lon;

  bool operator==(const GtfsStop& other) const = default;
};

struct GtfsTrip {
  GtfsRouteId route_id;
  int direction_id;
  GtfsTripId trip_id;
  GtfsServiceId service_id;
  std::optional<GtfsShapeId> shape_id;

  bool operator==(const GtfsTrip& other) const = default;
};

// One row of calendar.txt. Dates are inclusive YYYYMMDD.
struct GtfsCalendar {
  GtfsServiceId service_id;
  // Indexed like DayOfWeek: Sunday = 0 through Saturday = 6.
  std::array<bool, 7> runs_on;
  std::string start_date;
  std::string end_date;

  bool operator==(const GtfsCalendar& other) const = default;
};

enum class GtfsExceptionType { kServiceAdded = 1, kServiceRemoved = 2 };

struct GtfsCalendarDate {
  GtfsServiceId service_id;
  std::string date;
  GtfsExceptionType exception_type;

  bool operator==(const GtfsCalendarDate& other) const = default;
};

struct GtfsStopTime {
  GtfsTripId trip_id;
  GtfsStopId stop_id;
  int stop_sequence;
  GtfsTimeSinceServiceStart arrival_time;
  GtfsTimeSinceServiceStart departure_time;

  bool operator==(const GtfsStopTime& other) const = default;
};

struct GtfsRoute {
  GtfsRouteId route_id;
  std::string route_short_name;
  std::string route_long_name;

  bool operator==(const GtfsRoute& other) const = default;
};

struct GtfsShapePoint {
  GtfsShapeId shape_id;
  double shape_pt_lat;
  double shape_pt_lon;
  int shape_pt_sequence;

  bool operator==(const GtfsShapePoint& other) const = default;
};

struct Gtfs {
  std::vector<GtfsStop> stops;
  std::vector<GtfsTrip> trips;
  std::vector<GtfsCalendar> calendar;
  std::vector<GtfsCalendarDate> calendar_dates;
  std::vector<GtfsStopTime> stop_times;
  std::vector<GtfsRoute> routes;
  std::vector<GtfsShapePoint> shapes;
  // Rows of stop_times.txt skipped for an unparseable arrival or departure.
  int malformed_stop_times = 0;
};

// The subset of a feed that is in service on one date.
struct GtfsDay {
  std::string date;
  std::vector<GtfsStop> stops;
  std::vector<GtfsTrip> trips;
  std::vector<GtfsStopTime> stop_times;
  std::vector<GtfsRoute> routes;
  std::vector<GtfsShapePoint> shapes;
};

// Load all GTFS data from a directory containing GTFS files.
// calendar_dates.txt and shapes.txt are optional. A stop time with a
// malformed time is skipped and counted in Gtfs::malformed_stop_times; any
// other bad row fails the load.
Gtfs GtfsLoad(const std::string& gtfs_directory_path);

// Filter GTFS data to only include services that run on the given date
// Date should be in "YYYYMMDD" format (e.g., "20240315").
// calendar_dates exceptions are applied: removed services are dropped even if
// the weekly calendar has them, added services are kept even if it does not.
GtfsDay GtfsFilterByDate(const Gtfs& gtfs, const std::string& date);

// Parse GTFS time string (HH:MM:SS format) to GtfsTimeSinceServiceStart
GtfsTimeSinceServiceStart ParseGtfsTime(std::string_view time_str);

// Format as HH:MM:SS (hours may exceed 23).
std::string FormatGtfsTime(const GtfsTimeSinceServiceStart& time);

template <typename Id>
  requires requires(const Id& id) { id.v; }
void PrintTo(const Id& id, std::ostream* os) {
  *os << '"' << id.v << '"';
}

inline void PrintTo(const GtfsTimeSinceServiceStart& time, std::ostream* os) {
  *os << FormatGtfsTime(time);
}

inline void PrintTo(const GtfsTrip& trip, std::ostream* os) {
  *os << std::format(
      "GtfsTrip{{{} dir {} on {} shape {}}}",
      trip.trip_id.v,
      trip.direction_id,
      trip.route_id.v,
      trip.shape_id ? trip.shape_id->v : "none"
  );
}

inline void PrintTo(const GtfsStopTime& stop_time, std::ostream* os) {
  *os << std::format(
      "GtfsStopTime{{{} #{} at {} {}}}",
      stop_time.trip_id.v,
      stop_time.stop_sequence,
      stop_time.stop_id.v,
      FormatGtfsTime(stop_time.arrival_time)
  );
}

}  // namespace transitperf

namespace transitperf {

template <typename Id>
struct GtfsIdHash {
  size_t operator()(const Id& id) const { return std::hash<std::string>()(id.v); }
};

}  // namespace transitperf

template <>
struct std::hash<transitperf::GtfsStopId>
    : transitperf::GtfsIdHash<transitperf::GtfsStopId> {};
template <>
struct std::hash<transitperf::GtfsRouteId>
    : transitperf::GtfsIdHash<transitperf::GtfsRouteId> {};
template <>
struct std::hash<transitperf::GtfsTripId>
    : transitperf::GtfsIdHash<transitperf::GtfsTripId> {};
template <>
struct std::hash<transitperf::GtfsServiceId>
    : transitperf::GtfsIdHash<transitperf::GtfsServiceId> {};
template <>
struct std::hash<transitperf::GtfsShapeId>
    : transitperf::GtfsIdHash<transitperf::GtfsShapeId> {};
