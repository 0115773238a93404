#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include "r4mw4tch/core/trace_result.hpp"

namespace r4mtool {

struct address_activity {
  std::string region;
  uint32_t address = 0;
  uint64_t events = 0;
  uint32_t peak_freq = 0;
  uint64_t first_frame = 0;
  uint64_t last_frame = 0;
};

struct log_summary {
  uint64_t events = 0;
  uint64_t malformed_rows = 0;
  uint64_t first_frame = 0;
  uint64_t last_frame = 0;
  uint64_t frame_sets = 0;
  std::map<std::string, uint64_t> events_by_region;
  uint64_t distinct_addresses = 0;
  std::vector<address_activity> hottest; // most events first
};

struct summary_options {
  size_t top = 10;
  std::string region_filter; // empty keeps every region
};

/**
 * @brief aggregates an event log
 *
 * a leading header row is skipped. rows that fail to parse are counted and
 * otherwise ignored.
 */
r4mw4tch::trace_result<log_summary> summarize_log(std::istream& input, const summary_options& options);

} // namespace r4mtool
