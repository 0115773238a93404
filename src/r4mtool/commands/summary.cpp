#include "summary.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>

#include <redlog.hpp>

#include "r4mbase/format_utils.hpp"
#include "r4mtool/log_summary.hpp"

namespace r4mtool::commands {

int summary(
    args::ValueFlag<std::string>& file_flag, args::ValueFlag<size_t>& top_flag,
    args::ValueFlag<std::string>& region_flag
) {
  auto log = redlog::get_logger("r4mtool.summary");

  if (!file_flag) {
    log.error("event log path required (--file)");
    return 1;
  }

  std::string path = args::get(file_flag);
  std::ifstream input(path, std::ios::in | std::ios::binary);
  if (!input.is_open()) {
    log.error("cannot open event log", redlog::field("path", path));
    return 1;
  }

  summary_options options;
  if (top_flag) {
    options.top = args::get(top_flag);
  }
  if (region_flag) {
    options.region_filter = args::get(region_flag);
  }

  log.info("summarizing event log", redlog::field("path", path));
  auto result = summarize_log(input, options);
  if (!result.ok()) {
    log.error("failed to read event log", redlog::field("error", result.status.message));
    return 1;
  }

  const log_summary& summary = result.value;
  std::cout << "=== Event Log Summary ===\n";
  std::cout << "file: " << path << "\n";
  std::cout << "events: " << r4mw4tch::util::format_number(summary.events) << "\n";
  if (summary.malformed_rows > 0) {
    std::cout << "malformed rows: " << r4mw4tch::util::format_number(summary.malformed_rows) << "\n";
  }
  if (summary.events > 0) {
    std::cout << "frames: " << summary.first_frame << " - " << summary.last_frame << "\n";
  }
  std::cout << "frame sets: " << summary.frame_sets << "\n";
  std::cout << "distinct addresses: " << r4mw4tch::util::format_number(summary.distinct_addresses) << "\n";
  std::cout << "\n";

  std::cout << "=== Regions ===\n";
  for (const auto& [region, count] : summary.events_by_region) {
    std::cout << std::left << std::setw(8) << region << r4mw4tch::util::format_number(count) << "\n";
  }
  std::cout << "\n";

  std::cout << "=== Hottest Addresses ===\n";
  std::cout << std::left << std::setw(12) << "Address" << std::setw(8) << "Region" << std::setw(10) << "Events"
            << std::setw(10) << "PeakFreq" << "Frames\n";
  for (const auto& entry : summary.hottest) {
    std::cout << std::left << std::setw(12) << r4mw4tch::util::format_address(entry.address) << std::setw(8)
              << entry.region << std::setw(10) << entry.events << std::setw(10) << entry.peak_freq << entry.first_frame
              << "-" << entry.last_frame << "\n";
  }

  return 0;
}

} // namespace r4mtool::commands
