#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace r4mw4tch {

enum class diagnostic_kind {
  io_failure,         // log or session files could not be written
  frame_fault,        // exception contained at the frame boundary
  screenshot_failure, // host did not produce the frame-set screenshot
  host_default,       // pc or keys unavailable, default substituted
  desynchronized,     // regions wrapped on different frames
  config_rejected,    // tracer refused to start
};

inline const char* diagnostic_kind_name(diagnostic_kind kind) {
  switch (kind) {
  case diagnostic_kind::io_failure:
    return "io_failure";
  case diagnostic_kind::frame_fault:
    return "frame_fault";
  case diagnostic_kind::screenshot_failure:
    return "screenshot_failure";
  case diagnostic_kind::host_default:
    return "host_default";
  case diagnostic_kind::desynchronized:
    return "desynchronized";
  case diagnostic_kind::config_rejected:
    return "config_rejected";
  }
  return "unknown";
}

struct trace_diagnostic {
  diagnostic_kind kind = diagnostic_kind::frame_fault;
  uint64_t frame = 0;
  std::string message;
};

using diagnostic_sink = std::function<void(const trace_diagnostic&)>;

struct tracer_stats {
  uint64_t frames_seen = 0;
  uint64_t frames_traced = 0;
  uint64_t chunks_scanned = 0;
  uint64_t words_scanned = 0;
  uint64_t change_events = 0;
  uint64_t frame_sets_completed = 0;
  uint64_t screenshots_failed = 0;
  uint64_t frame_faults = 0;
  uint64_t forced_flushes = 0;
  uint64_t io_failures = 0;
  uint64_t pc_defaults = 0;
  uint64_t key_defaults = 0;
};

} // namespace r4mw4tch
