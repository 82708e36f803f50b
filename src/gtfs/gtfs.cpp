#include "gtfs/gtfs.h"

#include <csv.hpp>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>

#include "util/date.h"

namespace transitperf {

GtfsTimeSinceServiceStart ParseGtfsTime(std::string_view time_str) {
  // GTFS allows single-digit hours ("7:05:00") and hours past 24.
  const size_t first_colon = time_str.find(':');
  if (first_colon == std::string_view::npos || first_colon == 0 ||
      first_colon > 3 || time_str.size() != first_colon + 6 ||
      time_str[first_colon + 3] != ':') {
    throw std::runtime_error("Invalid time format: " + std::string(time_str));
  }

  auto digit = [&](size_t i) {
    char c = time_str[i];
    if (c < '0' || c > '9') {
      throw std::runtime_error(
          "Invalid time format - non-digit characters: " +
          std::string(time_str)
      );
    }
    return c - '0';
  };

  int hours = 0;
  for (size_t i = 0; i < first_colon; ++i) {
    hours = hours * 10 + digit(i);
  }
  int minutes = digit(first_colon + 1) * 10 + digit(first_colon + 2);
  int seconds = digit(first_colon + 4) * 10 + digit(first_colon + 5);
  if (minutes > 59 || seconds > 59) {
    throw std::runtime_error("Invalid time format: " + std::string(time_str));
  }

  return GtfsTimeSinceServiceStart{hours * 3600 + minutes * 60 + seconds};
}

std::string FormatGtfsTime(const GtfsTimeSinceServiceStart& time) {
  return std::format(
      "{:02}:{:02}:{:02}",
      time.seconds / 3600,
      (time.seconds % 3600) / 60,
      time.seconds % 60
  );
}

namespace {

// Reads every row of one GTFS file into `out`, wrapping any csv or
// conversion error with the file path. `bytes_per_row` sizes the initial
// reservation from the file size.
template <typename T, typename RowFn>
void ReadGtfsFile(
    const std::string& path,
    size_t bytes_per_row,
    std::vector<T>& out,
    RowFn&& row_fn
) {
  try {
    csv::CSVReader reader(path);
    out.reserve(std::filesystem::file_size(path) / bytes_per_row);
    row_fn(reader);
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Could not open or parse file: " + path + " - " + e.what()
    );
  }
}

// An optional column's value, or "" when the column is absent.
std::string OptionalField(csv::CSVRow& row, int column) {
  if (column == csv::CSV_NOT_FOUND) {
    return "";
  }
  return row[static_cast<size_t>(column)].get<std::string>();
}

std::vector<GtfsStop> LoadStops(const std::string& path) {
  std::vector<GtfsStop> stops;
  ReadGtfsFile(path, 100, stops, [&](csv::CSVReader& reader) {
    const int name_col = reader.index_of("stop_name");
    for (csv::CSVRow& row : reader) {
      stops.push_back(GtfsStop{
          .stop_id = GtfsStopId{row["stop_id"].get<std::string>()},
          .stop_name = OptionalField(row, name_col),
          .stop_lat = row["stop_lat"].get<double>(),
          .stop_lon = row["stop_lon"].get<double>(),
      });
    }
  });
  return stops;
}

std::vector<GtfsTrip> LoadTrips(const std::string& path) {
  std::vector<GtfsTrip> trips;
  ReadGtfsFile(path, 80, trips, [&](csv::CSVReader& reader) {
    const int direction_col = reader.index_of("direction_id");
    const int shape_col = reader.index_of("shape_id");
    for (csv::CSVRow& row : reader) {
      std::string direction = OptionalField(row, direction_col);
      std::string shape = OptionalField(row, shape_col);
      trips.push_back(GtfsTrip{
          .route_id = GtfsRouteId{row["route_id"].get<std::string>()},
          .direction_id = direction.empty() ? 0 : std::stoi(direction),
          .trip_id = GtfsTripId{row["trip_id"].get<std::string>()},
          .service_id = GtfsServiceId{row["service_id"].get<std::string>()},
          .shape_id = shape.empty()
                          ? std::nullopt
                          : std::optional<GtfsShapeId>(GtfsShapeId{shape}),
      });
    }
  });
  return trips;
}

std::vector<GtfsCalendar> LoadCalendar(const std::string& path) {
  // In DayOfWeek order.
  static constexpr const char* kDayColumns[7] = {
      "sunday",
      "monday",
      "tuesday",
      "wednesday",
      "thursday",
      "friday",
      "saturday",
  };
  std::vector<GtfsCalendar> calendars;
  ReadGtfsFile(path, 60, calendars, [&](csv::CSVReader& reader) {
    for (csv::CSVRow& row : reader) {
      GtfsCalendar& calendar = calendars.emplace_back();
      calendar.service_id = GtfsServiceId{row["service_id"].get<std::string>()};
      for (int day = 0; day < 7; ++day) {
        calendar.runs_on[day] = row[kDayColumns[day]].get<std::string>() == "1";
      }
      calendar.start_date = row["start_date"].get<std::string>();
      calendar.end_date = row["end_date"].get<std::string>();
    }
  });
  return calendars;
}

std::vector<GtfsCalendarDate> LoadCalendarDates(const std::string& path) {
  std::vector<GtfsCalendarDate> calendar_dates;
  ReadGtfsFile(path, 30, calendar_dates, [&](csv::CSVReader& reader) {
    for (csv::CSVRow& row : reader) {
      const int exception_type = row["exception_type"].get<int>();
      if (exception_type != 1 && exception_type != 2) {
        throw std::runtime_error(
            "unknown exception_type " + std::to_string(exception_type)
        );
      }
      calendar_dates.push_back(GtfsCalendarDate{
          .service_id = GtfsServiceId{row["service_id"].get<std::string>()},
          .date = row["date"].get<std::string>(),
          .exception_type = static_cast<GtfsExceptionType>(exception_type),
      });
    }
  });
  return calendar_dates;
}

std::vector<GtfsStopTime> LoadStopTimes(
    const std::string& path, int& malformed
) {
  std::vector<GtfsStopTime> stop_times;
  ReadGtfsFile(path, 70, stop_times, [&](csv::CSVReader& reader) {
    for (csv::CSVRow& row : reader) {
      auto arrival = row["arrival_time"].get<std::string_view>();
      auto departure = row["departure_time"].get<std::string_view>();
      // Untimed stops carry no schedule to measure against.
      if (arrival.empty() || departure.empty()) {
        continue;
      }
      GtfsTimeSinceServiceStart arrival_time;
      GtfsTimeSinceServiceStart departure_time;
      try {
        arrival_time = ParseGtfsTime(arrival);
        departure_time = ParseGtfsTime(departure);
      } catch (const std::runtime_error&) {
        malformed++;
        continue;
      }
      stop_times.push_back(GtfsStopTime{
          .trip_id = GtfsTripId{row["trip_id"].get<std::string>()},
          .stop_id = GtfsStopId{row["stop_id"].get<std::string>()},
          .stop_sequence = row["stop_sequence"].get<int>(),
          .arrival_time = arrival_time,
          .departure_time = departure_time,
      });
    }
  });
  return stop_times;
}

std::vector<GtfsRoute> LoadRoutes(const std::string& path) {
  std::vector<GtfsRoute> routes;
  ReadGtfsFile(path, 60, routes, [&](csv::CSVReader& reader) {
    const int short_name_col = reader.index_of("route_short_name");
    const int long_name_col = reader.index_of("route_long_name");
    for (csv::CSVRow& row : reader) {
      routes.push_back(GtfsRoute{
          .route_id = GtfsRouteId{row["route_id"].get<std::string>()},
          .route_short_name = OptionalField(row, short_name_col),
          .route_long_name = OptionalField(row, long_name_col),
      });
    }
  });
  return routes;
}

std::vector<GtfsShapePoint> LoadShapes(const std::string& path) {
  std::vector<GtfsShapePoint> shapes;
  ReadGtfsFile(path, 45, shapes, [&](csv::CSVReader& reader) {
    for (csv::CSVRow& row : reader) {
      shapes.push_back(GtfsShapePoint{
          .shape_id = GtfsShapeId{row["shape_id"].get<std::string>()},
          .shape_pt_lat = row["shape_pt_lat"].get<double>(),
          .shape_pt_lon = row["shape_pt_lon"].get<double>(),
          .shape_pt_sequence = row["shape_pt_sequence"].get<int>(),
      });
    }
  });
  return shapes;
}

template <typename T, typename Key>
void CopyIf(
    const std::vector<T>& in,
    std::vector<T>& out,
    const std::unordered_set<Key>& keep,
    Key T::*key
) {
  for (const auto& item : in) {
    if (keep.contains(item.*key)) {
      out.push_back(item);
    }
  }
}

}  // namespace

Gtfs GtfsLoad(const std::string& gtfs_directory_path) {
  const std::filesystem::path dir(gtfs_directory_path);
  auto file = [&dir](const char* name) { return (dir / name).string(); };

  Gtfs gtfs;
  gtfs.stops = LoadStops(file("stops.txt"));
  gtfs.trips = LoadTrips(file("trips.txt"));
  gtfs.stop_times =
      LoadStopTimes(file("stop_times.txt"), gtfs.malformed_stop_times);
  gtfs.routes = LoadRoutes(file("routes.txt"));

  // A feed may define service with calendar.txt, calendar_dates.txt or both.
  const bool has_calendar = std::filesystem::exists(file("calendar.txt"));
  const bool has_calendar_dates =
      std::filesystem::exists(file("calendar_dates.txt"));
  if (!has_calendar && !has_calendar_dates) {
    throw std::runtime_error(
        "GTFS directory " + gtfs_directory_path +
        " has neither calendar.txt nor calendar_dates.txt"
    );
  }
  if (has_calendar) {
    gtfs.calendar = LoadCalendar(file("calendar.txt"));
  }
  if (has_calendar_dates) {
    gtfs.calendar_dates = LoadCalendarDates(file("calendar_dates.txt"));
  }
  if (std::filesystem::exists(file("shapes.txt"))) {
    gtfs.shapes = LoadShapes(file("shapes.txt"));
  }
  return gtfs;
}

GtfsDay GtfsFilterByDate(const Gtfs& gtfs, const std::string& date) {
  const int day_of_week = DayOfWeek(date);

  std::unordered_set<GtfsServiceId> services;
  for (const auto& calendar : gtfs.calendar) {
    if (date >= calendar.start_date && date <= calendar.end_date &&
        calendar.runs_on[day_of_week]) {
      services.insert(calendar.service_id);
    }
  }
  for (const auto& exception : gtfs.calendar_dates) {
    if (exception.date != date) {
      continue;
    }
    if (exception.exception_type == GtfsExceptionType::kServiceAdded) {
      services.insert(exception.service_id);
    } else {
      services.erase(exception.service_id);
    }
  }

  GtfsDay result;
  result.date = date;
  std::unordered_set<GtfsTripId> trips;
  std::unordered_set<GtfsRouteId> routes;
  std::unordered_set<GtfsShapeId> shapes;
  for (const auto& trip : gtfs.trips) {
    if (!services.contains(trip.service_id)) {
      continue;
    }
    result.trips.push_back(trip);
    trips.insert(trip.trip_id);
    routes.insert(trip.route_id);
    if (trip.shape_id) {
      shapes.insert(*trip.shape_id);
    }
  }

  std::unordered_set<GtfsStopId> stops;
  for (const auto& stop_time : gtfs.stop_times) {
    if (trips.contains(stop_time.trip_id)) {
      result.stop_times.push_back(stop_time);
      stops.insert(stop_time.stop_id);
    }
  }

  CopyIf(gtfs.stops, result.stops, stops, &GtfsStop::stop_id);
  CopyIf(gtfs.routes, result.routes, routes, &GtfsRoute::route_id);
  CopyIf(gtfs.shapes, result.shapes, shapes, &GtfsShapePoint::shape_id);
  return result;
}

}  // namespace transitperf
