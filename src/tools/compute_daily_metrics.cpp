#include <CLI/CLI.hpp>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "config/pipeline_config.h"
#include "gtfs/gtfs.h"
#include "log.h"
#include "metrics/metrics_aggregator.h"
#include "report/run_report_json.h"
#include "store/metrics_store.h"
#include "store/position_store.h"

using namespace transitperf;

int main(int argc, char* argv[]) {
  CLI::App app{"Compute daily route performance metrics from position samples"};

  std::string config_path;
  std::string start_date;
  std::string end_date;
  std::string route;
  std::string report_path;
  bool recalculate = false;

  app.add_option("--config", config_path, "Path to pipeline TOML config file")
      ->required();
  app.add_option("--start-date", start_date, "First service day (YYYYMMDD)")
      ->required();
  app.add_option(
      "--end-date",
      end_date,
      "Last service day (YYYYMMDD), defaults to the start date"
  );
  app.add_option("--route", route, "Only compute this route");
  app.add_flag(
      "--recalculate",
      recalculate,
      "Recompute and replace days that already have metrics"
  );
  app.add_option(
      "--report",
      report_path,
      "Write the JSON run report here, overriding the config"
  );

  CLI11_PARSE(app, argc, argv);

  TextLogger logger = SynchronizedLogger(OstreamLogger(std::cerr));
  try {
    PipelineConfig config = PipelineConfigLoad(config_path);
    if (!report_path.empty()) {
      config.report_path = report_path;
    }

    Log(logger, "Loading GTFS data from: {}", config.gtfs_dir);
    Gtfs gtfs = GtfsLoad(config.gtfs_dir);
    Log(logger,
        "Loaded: {} stops, {} trips, {} stop times, {} routes",
        gtfs.stops.size(),
        gtfs.trips.size(),
        gtfs.stop_times.size(),
        gtfs.routes.size());
    if (gtfs.malformed_stop_times > 0) {
      Log(logger,
          "Skipped {} stop times with malformed times",
          gtfs.malformed_stop_times);
    }

    PositionStore positions(config.positions_db);
    MetricsStore metrics(config.metrics_db, config.rolling_window_days);
    MetricsAggregator aggregator(
        gtfs, positions, metrics, config.aggregator, logger
    );

    RunRequest request{
        .start_date = start_date,
        .end_date = end_date.empty() ? start_date : end_date,
        .route_filter = std::nullopt,
        .recalculate = recalculate,
    };
    if (!route.empty()) {
      request.route_filter = GtfsRouteId{route};
    }
    RunReport report = aggregator.Run(request);

    std::cout << RunReportToJson(report).dump(2) << "\n";
    if (config.report_path) {
      WriteRunReport(report, *config.report_path);
    }
    Log(logger,
        "{} persisted, {} skipped, {} failed",
        report.persisted,
        report.skipped,
        report.failed);
    return report.ExitCode();
  } catch (const std::exception& e) {
    Log(logger, "Error: {}", e.what());
    return 1;
  }
}
