#include "store/position_store.h"

namespace transitperf {

PositionStore::PositionStore(const std::string& path) : db_(path) {
  db_.exec("PRAGMA journal_mode=WAL");
  db_.exec(
      "CREATE TABLE IF NOT EXISTS vehicle_positions ("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  vehicle_id TEXT NOT NULL,"
      "  route_id TEXT NOT NULL,"
      "  trip_id TEXT,"
      "  latitude REAL NOT NULL,"
      "  longitude REAL NOT NULL,"
      "  speed REAL,"
      "  bearing REAL,"
      "  reported_deviation INTEGER,"
      "  timestamp INTEGER NOT NULL"
      ")"
  );
  db_.exec(
      "CREATE INDEX IF NOT EXISTS idx_vehicle_positions_route_time "
      "ON vehicle_positions (route_id, timestamp)"
  );
}

void PositionStore::Append(const std::vector<PositionSample>& samples) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction transaction(db_);
  SqliteStmt insert(
      db_,
      "INSERT INTO vehicle_positions (vehicle_id, route_id, trip_id, latitude, "
      "longitude, speed, bearing, reported_deviation, timestamp) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
  );
  for (const auto& sample : samples) {
    insert.bind_text(1, sample.vehicle_id);
    insert.bind_text(2, sample.route_id.v);
    if (sample.trip_id_hint) {
      insert.bind_text(3, sample.trip_id_hint->v);
    } else {
      insert.bind_null(3);
    }
    insert.bind_double(4, sample.lat);
    insert.bind_double(5, sample.lon);
    insert.bind_optional_double(6, sample.speed);
    insert.bind_optional_double(7, sample.bearing);
    insert.bind_optional_int(8, sample.reported_deviation_seconds);
    insert.bind_int64(9, sample.observed_at);
    insert.step_and_reset();
  }
  transaction.commit();
}

std::vector<PositionSample> PositionStore::Load(
    const GtfsRouteId& route_id, int64_t start, int64_t end
) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStmt query(
      db_,
      "SELECT id, vehicle_id, route_id, trip_id, latitude, longitude, speed, "
      "bearing, reported_deviation, timestamp FROM vehicle_positions "
      "WHERE route_id = ? AND timestamp >= ? AND timestamp < ? "
      "ORDER BY timestamp, id"
  );
  query.bind_text(1, route_id.v);
  query.bind_int64(2, start);
  query.bind_int64(3, end);

  std::vector<PositionSample> samples;
  while (query.step()) {
    PositionSample& sample = samples.emplace_back();
    sample.sample_id = query.column_int64(0);
    sample.vehicle_id = query.column_text(1);
    sample.route_id = GtfsRouteId{query.column_text(2)};
    if (auto trip_id = query.column_optional_text(3);
        trip_id && !trip_id->empty()) {
      sample.trip_id_hint = GtfsTripId{*trip_id};
    }
    sample.lat = query.column_double(4);
    sample.lon = query.column_double(5);
    sample.speed = query.column_optional_double(6);
    sample.bearing = query.column_optional_double(7);
    sample.reported_deviation_seconds = query.column_optional_int(8);
    sample.observed_at = query.column_int64(9);
  }
  return samples;
}

std::vector<GtfsRouteId> PositionStore::RoutesWithSamples(
    int64_t start, int64_t end
) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStmt query(
      db_,
      "SELECT DISTINCT route_id FROM vehicle_positions "
      "WHERE timestamp >= ? AND timestamp < ? ORDER BY route_id"
  );
  query.bind_int64(1, start);
  query.bind_int64(2, end);

  std::vector<GtfsRouteId> routes;
  while (query.step()) {
    routes.push_back(GtfsRouteId{query.column_text(0)});
  }
  return routes;
}

}  // namespace transitperf
