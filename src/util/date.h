#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace transitperf {

constexpr int64_t kSecondsPerDay = 24 * 3600;

// Offsets a date in YYYYMMDD format by the given number of days.
// Positive days moves forward, negative days moves backward.
std::string OffsetDate(const std::string& date, int days);

// True if `date` is a real calendar date in YYYYMMDD format.
bool IsValidDate(const std::string& date);

// Timestamp (local wall-clock seconds since 1970-01-01 00:00) of midnight at
// the start of `date`.
int64_t DayStartTimestamp(const std::string& date);

// 0=Sunday, 1=Monday, ..., 6=Saturday.
int DayOfWeek(const std::string& date);

// All dates from `first` to `last` inclusive. Empty if `last` < `first`.
std::vector<std::string> DateRange(
    const std::string& first, const std::string& last
);

// Number of days from `from` to `to` (negative if `to` is earlier).
int DaysBetween(const std::string& from, const std::string& to);

}  // namespace transitperf
