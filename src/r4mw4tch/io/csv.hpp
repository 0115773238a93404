#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "r4mw4tch/core/trace_result.hpp"
#include "r4mw4tch/io/change_event.hpp"

namespace r4mw4tch::csv {

// column order of the event log. only written as a first row when write_header is set;
// readers that take every row as an event must skip it
constexpr const char* event_header =
    "timestamp_ms,region,frame,address,prev_val,curr_val,freq,pc,last_keys,current_keys,frame_set_id,chunk_id";

constexpr size_t event_column_count = 12;

// quotes a field containing a comma, quote or line break and doubles inner quotes
std::string escape_field(std::string_view value);

// like escape_field, with empty values written as "None"
std::string escape_keys(std::string_view value);

// one log line without the trailing newline
std::string format_event(const change_event& event);

// splits one record; fails on an unterminated quote or stray characters after a closing quote
trace_result<std::vector<std::string>> parse_record(std::string_view line);

trace_result<change_event> parse_event(const std::vector<std::string>& fields);

/**
 * @brief reads records from a stream, joining physical lines inside quoted fields
 */
class record_reader {
public:
  explicit record_reader(std::istream& input) : input_(input) {}

  // false at end of input; a malformed record is returned through `status`
  bool next(std::vector<std::string>& fields, trace_status& status);

  size_t line_number() const { return line_number_; }

private:
  std::istream& input_;
  size_t line_number_ = 0;
};

} // namespace r4mw4tch::csv
