#include "r4mw4tch/io/csv.hpp"

#include "r4mbase/format_utils.hpp"
#include "r4mbase/parse_utils.hpp"
#include "r4mw4tch/input/key_names.hpp"

namespace r4mw4tch::csv {

namespace {

bool needs_quotes(std::string_view value) {
  return value.find_first_of(",\"\r\n") != std::string_view::npos;
}

// counts quote characters to tell whether a physical line ends inside a quoted field
bool ends_inside_quotes(std::string_view text) {
  bool inside = false;
  for (char ch : text) {
    if (ch == '"') {
      inside = !inside;
    }
  }
  return inside;
}

} // namespace

std::string escape_field(std::string_view value) {
  if (!needs_quotes(value)) {
    return std::string(value);
  }

  std::string out;
  out.reserve(value.size() + 2);
  out += '"';
  for (char ch : value) {
    if (ch == '"') {
      out += '"';
    }
    out += ch;
  }
  out += '"';
  return out;
}

std::string escape_keys(std::string_view value) {
  if (value.empty()) {
    return no_keys_sentinel;
  }
  return escape_field(value);
}

std::string format_event(const change_event& event) {
  std::string line;
  line.reserve(128);

  line += std::to_string(event.timestamp_ms);
  line += ',';
  line += escape_field(event.region);
  line += ',';
  line += std::to_string(event.frame);
  line += ',';
  line += util::format_hex8(event.address);
  line += ',';
  line += util::format_hex8(event.prev_val);
  line += ',';
  line += util::format_hex8(event.curr_val);
  line += ',';
  line += std::to_string(event.freq);
  line += ',';
  line += util::format_hex8(event.pc);
  line += ',';
  line += escape_keys(event.last_keys);
  line += ',';
  line += escape_keys(event.current_keys);
  line += ',';
  line += std::to_string(event.frame_set_id);
  line += ',';
  line += std::to_string(event.chunk_id);
  return line;
}

trace_result<std::vector<std::string>> parse_record(std::string_view line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  bool after_quote = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char ch = line[i];

    if (quoted) {
      if (ch != '"') {
        field += ch;
        continue;
      }
      if (i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        ++i;
        continue;
      }
      quoted = false;
      after_quote = true;
      continue;
    }

    if (ch == ',') {
      fields.push_back(std::move(field));
      field.clear();
      after_quote = false;
      continue;
    }

    if (after_quote) {
      if (ch == '\r' && i + 1 == line.size()) {
        continue;
      }
      return error_result<std::vector<std::string>>(
          error_code::invalid_argument, "unexpected character after closing quote at column " + std::to_string(i)
      );
    }

    if (ch == '"' && field.empty()) {
      quoted = true;
      continue;
    }

    if (ch == '\r' && i + 1 == line.size()) {
      continue;
    }

    field += ch;
  }

  if (quoted) {
    return error_result<std::vector<std::string>>(error_code::invalid_argument, "unterminated quoted field");
  }

  fields.push_back(std::move(field));
  return ok_result(std::move(fields));
}

trace_result<change_event> parse_event(const std::vector<std::string>& fields) {
  if (fields.size() != event_column_count) {
    return error_result<change_event>(
        error_code::invalid_argument, "expected " + std::to_string(event_column_count) + " columns, got " +
                                          std::to_string(fields.size())
    );
  }

  change_event event;
  std::string error;
  uint32_t chunk = 0;

  bool parsed = util::parse_u64(fields[0], event.timestamp_ms, &error) &&
                util::parse_u64(fields[2], event.frame, &error) &&
                util::parse_u32(fields[3], event.address, true, &error) &&
                util::parse_u32(fields[4], event.prev_val, true, &error) &&
                util::parse_u32(fields[5], event.curr_val, true, &error) &&
                util::parse_u32(fields[6], event.freq, false, &error) &&
                util::parse_u32(fields[7], event.pc, true, &error) &&
                util::parse_u64(fields[10], event.frame_set_id, &error) &&
                util::parse_u32(fields[11], chunk, false, &error);
  if (!parsed) {
    return error_result<change_event>(error_code::invalid_argument, error);
  }

  event.region = fields[1];
  event.last_keys = fields[8] == no_keys_sentinel ? std::string() : fields[8];
  event.current_keys = fields[9] == no_keys_sentinel ? std::string() : fields[9];
  event.chunk_id = chunk;
  return ok_result(std::move(event));
}

bool record_reader::next(std::vector<std::string>& fields, trace_status& status) {
  std::string record;
  std::string line;

  if (!std::getline(input_, line)) {
    return false;
  }
  line_number_++;
  record = line;

  while (ends_inside_quotes(record)) {
    if (!std::getline(input_, line)) {
      break;
    }
    line_number_++;
    record += '\n';
    record += line;
  }

  auto parsed = parse_record(record);
  status = parsed.status;
  fields = std::move(parsed.value);
  return true;
}

} // namespace r4mw4tch::csv
