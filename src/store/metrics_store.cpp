#include "store/metrics_store.h"

#include <stdexcept>

#include "util/date.h"

namespace transitperf {

namespace {

constexpr char kDailyMetricColumns[] =
    "route_id, day, otp_percent, early_percent, late_percent, "
    "avg_headway_minutes, median_headway_minutes, min_headway_minutes, "
    "max_headway_minutes, headway_stddev_minutes, headway_cv, avg_speed_mph, "
    "median_speed_mph, avg_deviation_seconds, total_samples, matched_samples, "
    "invalid_samples, arrival_events, unique_vehicles, unique_trips, "
    "vendor_otp_percent, vendor_observations";

void BindDailyMetric(SqliteStmt& stmt, const DailyMetric& m) {
  stmt.bind_text(1, m.route_id.v);
  stmt.bind_text(2, m.day);
  stmt.bind_optional_double(3, m.otp_percent);
  stmt.bind_optional_double(4, m.early_percent);
  stmt.bind_optional_double(5, m.late_percent);
  stmt.bind_optional_double(6, m.avg_headway_minutes);
  stmt.bind_optional_double(7, m.median_headway_minutes);
  stmt.bind_optional_double(8, m.min_headway_minutes);
  stmt.bind_optional_double(9, m.max_headway_minutes);
  stmt.bind_optional_double(10, m.headway_stddev_minutes);
  stmt.bind_optional_double(11, m.headway_cv);
  stmt.bind_optional_double(12, m.avg_speed_mph);
  stmt.bind_optional_double(13, m.median_speed_mph);
  stmt.bind_optional_double(14, m.avg_deviation_seconds);
  stmt.bind_int(15, m.total_samples);
  stmt.bind_int(16, m.matched_samples);
  stmt.bind_int(17, m.invalid_samples);
  stmt.bind_int(18, m.arrival_events);
  stmt.bind_int(19, m.unique_vehicles);
  stmt.bind_int(20, m.unique_trips);
  stmt.bind_optional_double(21, m.vendor_otp_percent);
  stmt.bind_int(22, m.vendor_observations);
}

DailyMetric ReadDailyMetric(SqliteStmt& stmt) {
  DailyMetric m;
  m.route_id = GtfsRouteId{stmt.column_text(0)};
  m.day = stmt.column_text(1);
  m.otp_percent = stmt.column_optional_double(2);
  m.early_percent = stmt.column_optional_double(3);
  m.late_percent = stmt.column_optional_double(4);
  m.avg_headway_minutes = stmt.column_optional_double(5);
  m.median_headway_minutes = stmt.column_optional_double(6);
  m.min_headway_minutes = stmt.column_optional_double(7);
  m.max_headway_minutes = stmt.column_optional_double(8);
  m.headway_stddev_minutes = stmt.column_optional_double(9);
  m.headway_cv = stmt.column_optional_double(10);
  m.avg_speed_mph = stmt.column_optional_double(11);
  m.median_speed_mph = stmt.column_optional_double(12);
  m.avg_deviation_seconds = stmt.column_optional_double(13);
  m.total_samples = stmt.column_int(14);
  m.matched_samples = stmt.column_int(15);
  m.invalid_samples = stmt.column_int(16);
  m.arrival_events = stmt.column_int(17);
  m.unique_vehicles = stmt.column_int(18);
  m.unique_trips = stmt.column_int(19);
  m.vendor_otp_percent = stmt.column_optional_double(20);
  m.vendor_observations = stmt.column_int(21);
  return m;
}

void DeleteDay(
    SqliteDb& db,
    const char* sql,
    const GtfsRouteId& route_id,
    const std::string& day
) {
  SqliteStmt stmt(db, sql);
  stmt.bind_text(1, route_id.v);
  stmt.bind_text(2, day);
  stmt.step_and_reset();
}

}  // namespace

MetricsStore::MetricsStore(const std::string& path, int rolling_window_days)
    : rolling_window_days_(rolling_window_days), db_(path) {
  db_.exec("PRAGMA journal_mode=WAL");
  db_.exec(
      "CREATE TABLE IF NOT EXISTS daily_metrics ("
      "  route_id TEXT NOT NULL,"
      "  day TEXT NOT NULL,"
      "  otp_percent REAL,"
      "  early_percent REAL,"
      "  late_percent REAL,"
      "  avg_headway_minutes REAL,"
      "  median_headway_minutes REAL,"
      "  min_headway_minutes REAL,"
      "  max_headway_minutes REAL,"
      "  headway_stddev_minutes REAL,"
      "  headway_cv REAL,"
      "  avg_speed_mph REAL,"
      "  median_speed_mph REAL,"
      "  avg_deviation_seconds REAL,"
      "  total_samples INTEGER NOT NULL,"
      "  matched_samples INTEGER NOT NULL,"
      "  invalid_samples INTEGER NOT NULL,"
      "  arrival_events INTEGER NOT NULL,"
      "  unique_vehicles INTEGER NOT NULL,"
      "  unique_trips INTEGER NOT NULL,"
      "  vendor_otp_percent REAL,"
      "  vendor_observations INTEGER NOT NULL,"
      "  PRIMARY KEY (route_id, day)"
      ")"
  );
  db_.exec(
      "CREATE TABLE IF NOT EXISTS daily_stop_otp ("
      "  route_id TEXT NOT NULL,"
      "  day TEXT NOT NULL,"
      "  stop_id TEXT NOT NULL,"
      "  early INTEGER NOT NULL,"
      "  on_time INTEGER NOT NULL,"
      "  late INTEGER NOT NULL,"
      "  otp_percent REAL,"
      "  PRIMARY KEY (route_id, day, stop_id)"
      ")"
  );
  db_.exec(
      "CREATE TABLE IF NOT EXISTS daily_period_otp ("
      "  route_id TEXT NOT NULL,"
      "  day TEXT NOT NULL,"
      "  period TEXT NOT NULL,"
      "  early INTEGER NOT NULL,"
      "  on_time INTEGER NOT NULL,"
      "  late INTEGER NOT NULL,"
      "  otp_percent REAL,"
      "  PRIMARY KEY (route_id, day, period)"
      ")"
  );
  db_.exec(
      "CREATE TABLE IF NOT EXISTS rolling_summary ("
      "  route_id TEXT PRIMARY KEY,"
      "  window_days INTEGER NOT NULL,"
      "  days_analyzed INTEGER NOT NULL,"
      "  date_start TEXT NOT NULL,"
      "  date_end TEXT NOT NULL,"
      "  otp_percent REAL,"
      "  early_percent REAL,"
      "  late_percent REAL,"
      "  avg_headway_minutes REAL,"
      "  headway_cv REAL,"
      "  avg_speed_mph REAL,"
      "  total_arrival_events INTEGER NOT NULL,"
      "  total_vehicles INTEGER NOT NULL"
      ")"
  );
}

bool MetricsStore::HasDailyMetric(
    const GtfsRouteId& route_id, const std::string& day
) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStmt query(
      db_, "SELECT 1 FROM daily_metrics WHERE route_id = ? AND day = ?"
  );
  query.bind_text(1, route_id.v);
  query.bind_text(2, day);
  return query.step();
}

void MetricsStore::CommitDay(const DailyMetricRows& rows) {
  const DailyMetric& metric = rows.metric;
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction transaction(db_);

  DeleteDay(
      db_,
      "DELETE FROM daily_metrics WHERE route_id = ? AND day = ?",
      metric.route_id,
      metric.day
  );
  DeleteDay(
      db_,
      "DELETE FROM daily_stop_otp WHERE route_id = ? AND day = ?",
      metric.route_id,
      metric.day
  );
  DeleteDay(
      db_,
      "DELETE FROM daily_period_otp WHERE route_id = ? AND day = ?",
      metric.route_id,
      metric.day
  );

  const std::string insert_metric =
      std::string("INSERT INTO daily_metrics (") + kDailyMetricColumns +
      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
      "?, ?)";
  SqliteStmt insert(db_, insert_metric.c_str());
  BindDailyMetric(insert, metric);
  insert.step_and_reset();

  SqliteStmt insert_stop(
      db_,
      "INSERT INTO daily_stop_otp (route_id, day, stop_id, early, on_time, "
      "late, otp_percent) VALUES (?, ?, ?, ?, ?, ?, ?)"
  );
  for (const auto& stop : rows.stops) {
    insert_stop.bind_text(1, metric.route_id.v);
    insert_stop.bind_text(2, metric.day);
    insert_stop.bind_text(3, stop.stop_id.v);
    insert_stop.bind_int(4, stop.early);
    insert_stop.bind_int(5, stop.on_time);
    insert_stop.bind_int(6, stop.late);
    insert_stop.bind_optional_double(7, stop.otp_percent);
    insert_stop.step_and_reset();
  }

  SqliteStmt insert_period(
      db_,
      "INSERT INTO daily_period_otp (route_id, day, period, early, on_time, "
      "late, otp_percent) VALUES (?, ?, ?, ?, ?, ?, ?)"
  );
  for (const auto& period : rows.periods) {
    insert_period.bind_text(1, metric.route_id.v);
    insert_period.bind_text(2, metric.day);
    insert_period.bind_text(3, period.period);
    insert_period.bind_int(4, period.early);
    insert_period.bind_int(5, period.on_time);
    insert_period.bind_int(6, period.late);
    insert_period.bind_optional_double(7, period.otp_percent);
    insert_period.step_and_reset();
  }

  // The window ends at the latest persisted day, whichever order days were
  // computed in.
  SqliteStmt latest_query(
      db_, "SELECT MAX(day) FROM daily_metrics WHERE route_id = ?"
  );
  latest_query.bind_text(1, metric.route_id.v);
  latest_query.step();
  const std::string latest = latest_query.column_text(0);
  const std::vector<DailyMetric> window = LoadDailyMetricsLocked(
      metric.route_id, OffsetDate(latest, -(rolling_window_days_ - 1)), latest
  );
  std::optional<RollingSummary> summary = ComputeRollingSummary(
      metric.route_id, window, rolling_window_days_
  );
  if (!summary) {
    throw std::runtime_error(
        "No daily metrics for route " + metric.route_id.v + " after insert"
    );
  }

  SqliteStmt upsert_summary(
      db_,
      "INSERT OR REPLACE INTO rolling_summary (route_id, window_days, "
      "days_analyzed, date_start, date_end, otp_percent, early_percent, "
      "late_percent, avg_headway_minutes, headway_cv, avg_speed_mph, "
      "total_arrival_events, total_vehicles) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
  );
  upsert_summary.bind_text(1, summary->route_id.v);
  upsert_summary.bind_int(2, summary->window_days);
  upsert_summary.bind_int(3, summary->days_analyzed);
  upsert_summary.bind_text(4, summary->date_start);
  upsert_summary.bind_text(5, summary->date_end);
  upsert_summary.bind_optional_double(6, summary->otp_percent);
  upsert_summary.bind_optional_double(7, summary->early_percent);
  upsert_summary.bind_optional_double(8, summary->late_percent);
  upsert_summary.bind_optional_double(9, summary->avg_headway_minutes);
  upsert_summary.bind_optional_double(10, summary->headway_cv);
  upsert_summary.bind_optional_double(11, summary->avg_speed_mph);
  upsert_summary.bind_int(12, summary->total_arrival_events);
  upsert_summary.bind_int(13, summary->total_vehicles);
  upsert_summary.step_and_reset();

  transaction.commit();
}

std::vector<DailyMetric> MetricsStore::LoadDailyMetricsLocked(
    const GtfsRouteId& route_id,
    const std::string& first_day,
    const std::string& last_day
) {
  const std::string sql = std::string("SELECT ") + kDailyMetricColumns +
                          " FROM daily_metrics WHERE route_id = ? AND day >= "
                          "? AND day <= ? ORDER BY day";
  SqliteStmt query(db_, sql.c_str());
  query.bind_text(1, route_id.v);
  query.bind_text(2, first_day);
  query.bind_text(3, last_day);

  std::vector<DailyMetric> rows;
  while (query.step()) {
    rows.push_back(ReadDailyMetric(query));
  }
  return rows;
}

std::optional<DailyMetric> MetricsStore::LoadDailyMetric(
    const GtfsRouteId& route_id, const std::string& day
) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DailyMetric> rows = LoadDailyMetricsLocked(route_id, day, day);
  if (rows.empty()) {
    return std::nullopt;
  }
  return rows.front();
}

std::vector<StopOtp> MetricsStore::LoadStopOtp(
    const GtfsRouteId& route_id, const std::string& day
) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStmt query(
      db_,
      "SELECT stop_id, early, on_time, late, otp_percent FROM daily_stop_otp "
      "WHERE route_id = ? AND day = ? ORDER BY stop_id"
  );
  query.bind_text(1, route_id.v);
  query.bind_text(2, day);

  std::vector<StopOtp> stops;
  while (query.step()) {
    stops.push_back(StopOtp{
        .stop_id = GtfsStopId{query.column_text(0)},
        .early = query.column_int(1),
        .on_time = query.column_int(2),
        .late = query.column_int(3),
        .otp_percent = query.column_optional_double(4),
    });
  }
  return stops;
}

std::vector<PeriodOtp> MetricsStore::LoadPeriodOtp(
    const GtfsRouteId& route_id, const std::string& day
) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStmt query(
      db_,
      "SELECT period, early, on_time, late, otp_percent FROM daily_period_otp "
      "WHERE route_id = ? AND day = ? ORDER BY rowid"
  );
  query.bind_text(1, route_id.v);
  query.bind_text(2, day);

  std::vector<PeriodOtp> periods;
  while (query.step()) {
    periods.push_back(PeriodOtp{
        .period = query.column_text(0),
        .early = query.column_int(1),
        .on_time = query.column_int(2),
        .late = query.column_int(3),
        .otp_percent = query.column_optional_double(4),
    });
  }
  return periods;
}

std::optional<RollingSummary> MetricsStore::LoadRollingSummary(
    const GtfsRouteId& route_id
) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStmt query(
      db_,
      "SELECT window_days, days_analyzed, date_start, date_end, otp_percent, "
      "early_percent, late_percent, avg_headway_minutes, headway_cv, "
      "avg_speed_mph, total_arrival_events, total_vehicles "
      "FROM rolling_summary WHERE route_id = ?"
  );
  query.bind_text(1, route_id.v);
  if (!query.step()) {
    return std::nullopt;
  }

  RollingSummary summary;
  summary.route_id = route_id;
  summary.window_days = query.column_int(0);
  summary.days_analyzed = query.column_int(1);
  summary.date_start = query.column_text(2);
  summary.date_end = query.column_text(3);
  summary.otp_percent = query.column_optional_double(4);
  summary.early_percent = query.column_optional_double(5);
  summary.late_percent = query.column_optional_double(6);
  summary.avg_headway_minutes = query.column_optional_double(7);
  summary.headway_cv = query.column_optional_double(8);
  summary.avg_speed_mph = query.column_optional_double(9);
  summary.total_arrival_events = query.column_int(10);
  summary.total_vehicles = query.column_int(11);
  return summary;
}

}  // namespace transitperf
