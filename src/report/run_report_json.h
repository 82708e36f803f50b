#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "metrics/metrics_aggregator.h"
#include "serialization/optional.h"

namespace transitperf {

NLOHMANN_JSON_SERIALIZE_ENUM(
    JobState,
    {
        {JobState::kPending, "pending"},
        {JobState::kMatching, "matching"},
        {JobState::kClassifying, "classifying"},
        {JobState::kAggregating, "aggregating"},
        {JobState::kPersisted, "persisted"},
        {JobState::kFailed, "failed"},
        {JobState::kSkipped, "skipped"},
    }
)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    JobReport,
    route_id,
    day,
    status,
    reason,
    samples_seen,
    samples_matched,
    samples_invalid,
    events_produced,
    speed_outliers,
    headway_observations,
    write_attempts
)

// {"jobs": [...], "persisted": n, "skipped": n, "failed": n, "exit_code": n}
nlohmann::json RunReportToJson(const RunReport& report);

// Writes the report to `path`, creating parent directories.
void WriteRunReport(const RunReport& report, const std::string& path);

}  // namespace transitperf
