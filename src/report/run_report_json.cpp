#include "report/run_report_json.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace transitperf {

nlohmann::json RunReportToJson(const RunReport& report) {
  return nlohmann::json{
      {"jobs", report.jobs},
      {"persisted", report.persisted},
      {"skipped", report.skipped},
      {"failed", report.failed},
      {"exit_code", report.ExitCode()},
  };
}

void WriteRunReport(const RunReport& report, const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open report file: " + path);
  }
  out << RunReportToJson(report).dump(2) << "\n";
}

}  // namespace transitperf
