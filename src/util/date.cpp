#include "util/date.h"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace transitperf {

namespace {

std::chrono::sys_days ParseDate(const std::string& date) {
  if (!IsValidDate(date)) {
    throw std::runtime_error(
        "Invalid date format: " + date + " (expected YYYYMMDD)"
    );
  }
  int y = std::stoi(date.substr(0, 4));
  unsigned m = std::stoi(date.substr(4, 2));
  unsigned d = std::stoi(date.substr(6, 2));
  return std::chrono::sys_days{std::chrono::year_month_day{
      std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}
  }};
}

std::string FormatDate(std::chrono::sys_days days) {
  std::chrono::year_month_day result{days};
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << int(result.year()) << std::setw(2)
      << unsigned(result.month()) << std::setw(2) << unsigned(result.day());
  return oss.str();
}

}  // namespace

bool IsValidDate(const std::string& date) {
  if (date.length() != 8) return false;
  for (char c : date) {
    if (c < '0' || c > '9') return false;
  }
  int y = std::stoi(date.substr(0, 4));
  unsigned m = std::stoi(date.substr(4, 2));
  unsigned d = std::stoi(date.substr(6, 2));
  return std::chrono::year_month_day{
      std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}
  }
      .ok();
}

std::string OffsetDate(const std::string& date, int days) {
  return FormatDate(ParseDate(date) + std::chrono::days{days});
}

int64_t DayStartTimestamp(const std::string& date) {
  return static_cast<int64_t>(
             ParseDate(date).time_since_epoch().count()
         ) *
         kSecondsPerDay;
}

int DayOfWeek(const std::string& date) {
  return static_cast<int>(
      std::chrono::weekday{ParseDate(date)}.c_encoding()
  );
}

std::vector<std::string> DateRange(
    const std::string& first, const std::string& last
) {
  std::vector<std::string> dates;
  const int n = DaysBetween(first, last);
  for (int i = 0; i <= n; ++i) {
    dates.push_back(OffsetDate(first, i));
  }
  return dates;
}

int DaysBetween(const std::string& from, const std::string& to) {
  return static_cast<int>((ParseDate(to) - ParseDate(from)).count());
}

}  // namespace transitperf
