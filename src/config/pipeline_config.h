#pragma once

#include <optional>
#include <string>

#include "metrics/metrics_aggregator.h"

namespace transitperf {

struct PipelineConfig {
  // Directory holding the GTFS text files.
  std::string gtfs_dir;
  std::string positions_db;
  std::string metrics_db;
  // Where the JSON run report goes. Unset means stdout only.
  std::optional<std::string> report_path;
  int rolling_window_days = 7;
  AggregatorOptions aggregator;
};

// Parse a TOML config file. Paths are resolved relative to the config file's
// directory. Throws std::runtime_error on a parse error, a missing required
// key or an out of range value.
PipelineConfig PipelineConfigLoad(const std::string& config_path);

}  // namespace transitperf
