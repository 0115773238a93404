#include "log_summary.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include <redlog.hpp>

#include "r4mw4tch/io/csv.hpp"

namespace r4mtool {

r4mw4tch::trace_result<log_summary> summarize_log(std::istream& input, const summary_options& options) {
  auto log = redlog::get_logger("r4mtool.summary");

  log_summary summary;
  std::unordered_map<uint32_t, address_activity> activity;
  std::unordered_set<uint64_t> frame_sets;

  r4mw4tch::csv::record_reader reader(input);
  std::vector<std::string> fields;
  r4mw4tch::trace_status status;
  bool first_record = true;

  while (reader.next(fields, status)) {
    bool header = first_record && !fields.empty() && fields[0] == "timestamp_ms";
    first_record = false;
    if (header) {
      continue;
    }

    if (!status.ok()) {
      summary.malformed_rows++;
      log.dbg(
          "skipping malformed row", redlog::field("line", reader.line_number()), redlog::field("error", status.message)
      );
      continue;
    }

    if (fields.size() == 1 && fields[0].empty()) {
      continue;
    }

    auto parsed = r4mw4tch::csv::parse_event(fields);
    if (!parsed.ok()) {
      summary.malformed_rows++;
      log.dbg(
          "skipping malformed row", redlog::field("line", reader.line_number()),
          redlog::field("error", parsed.status.message)
      );
      continue;
    }

    const r4mw4tch::change_event& event = parsed.value;
    if (!options.region_filter.empty() && event.region != options.region_filter) {
      continue;
    }

    if (summary.events == 0 || event.frame < summary.first_frame) {
      summary.first_frame = event.frame;
    }
    summary.last_frame = std::max(summary.last_frame, event.frame);
    summary.events++;
    summary.events_by_region[event.region]++;
    frame_sets.insert(event.frame_set_id);

    auto [it, inserted] = activity.try_emplace(event.address);
    address_activity& entry = it->second;
    if (inserted) {
      entry.region = event.region;
      entry.address = event.address;
      entry.first_frame = event.frame;
    }
    entry.events++;
    entry.peak_freq = std::max(entry.peak_freq, event.freq);
    entry.first_frame = std::min(entry.first_frame, event.frame);
    entry.last_frame = std::max(entry.last_frame, event.frame);
  }

  summary.frame_sets = frame_sets.size();
  summary.distinct_addresses = activity.size();

  summary.hottest.reserve(activity.size());
  for (auto& [address, entry] : activity) {
    summary.hottest.push_back(entry);
  }
  std::sort(summary.hottest.begin(), summary.hottest.end(), [](const address_activity& a, const address_activity& b) {
    if (a.events != b.events) {
      return a.events > b.events;
    }
    return a.address < b.address;
  });
  if (summary.hottest.size() > options.top) {
    summary.hottest.resize(options.top);
  }

  if (input.bad()) {
    return r4mw4tch::error_result<log_summary>(r4mw4tch::error_code::io_error, "read error");
  }
  return r4mw4tch::ok_result(std::move(summary));
}

} // namespace r4mtool
