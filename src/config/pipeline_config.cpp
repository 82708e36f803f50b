#include "config/pipeline_config.h"

#include <filesystem>
#include <format>
#include <limits>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace transitperf {

namespace {

std::string RequiredString(const toml::table& config, std::string_view key) {
  auto value = config[key].value<std::string>();
  if (!value || value->empty()) {
    throw std::runtime_error(
        "Config file must contain " + std::string(key)
    );
  }
  return *value;
}

// Reads an optional integer, keeping `fallback` when the key is absent.
int IntInRange(
    const toml::table& config,
    std::string_view key,
    int fallback,
    int minimum,
    int maximum = std::numeric_limits<int>::max()
) {
  auto value = config[key].value<int64_t>();
  if (!value) {
    if (config.contains(key)) {
      throw std::runtime_error(std::string(key) + " must be an integer");
    }
    return fallback;
  }
  if (*value < minimum || *value > maximum) {
    throw std::runtime_error(std::format(
        "{} must be between {} and {}", key, minimum, maximum
    ));
  }
  return static_cast<int>(*value);
}

}  // namespace

PipelineConfig PipelineConfigLoad(const std::string& config_path) {
  toml::table config;
  try {
    config = toml::parse_file(config_path);
  } catch (const toml::parse_error& err) {
    throw std::runtime_error(
        "Failed to parse config file '" + config_path +
        "': " + std::string(err.what())
    );
  }

  std::filesystem::path config_dir =
      std::filesystem::weakly_canonical(config_path).parent_path();
  auto resolve = [&](const std::string& path) {
    return (config_dir / path).string();
  };

  PipelineConfig result{
      .gtfs_dir = resolve(RequiredString(config, "gtfs_dir")),
      .positions_db = resolve(RequiredString(config, "positions_db")),
      .metrics_db = resolve(RequiredString(config, "metrics_db")),
      .report_path = std::nullopt,
      .rolling_window_days = IntInRange(config, "rolling_window_days", 7, 1),
      .aggregator = AggregatorOptions{},
  };
  if (auto report = config["report_path"].value<std::string>()) {
    result.report_path = resolve(*report);
  }

  AggregatorOptions& options = result.aggregator;
  options.workers = IntInRange(config, "workers", options.workers, 0);
  options.min_samples =
      IntInRange(config, "min_samples", options.min_samples, 1);
  options.job_timeout = std::chrono::seconds(IntInRange(
      config,
      "job_timeout_seconds",
      static_cast<int>(
          std::chrono::duration_cast<std::chrono::seconds>(options.job_timeout)
              .count()
      ),
      1
  ));
  options.max_write_attempts = IntInRange(
      config,
      "max_write_attempts",
      options.max_write_attempts,
      1,
      kMaxWriteAttemptsLimit
  );
  options.retry_backoff = std::chrono::milliseconds(IntInRange(
      config,
      "retry_backoff_ms",
      static_cast<int>(options.retry_backoff.count()),
      0
  ));
  return result;
}

}  // namespace transitperf
