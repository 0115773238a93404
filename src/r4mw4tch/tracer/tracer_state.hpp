#pragma once

#include <filesystem>
#include <vector>

#include "r4mw4tch/input/key_history.hpp"
#include "r4mw4tch/io/event_log.hpp"
#include "r4mw4tch/scan/region_scanner.hpp"
#include "r4mw4tch/stats/frequency_window.hpp"
#include "r4mw4tch/sync/frame_set_sync.hpp"
#include "r4mw4tch/tracer/tracer_config.hpp"

namespace r4mw4tch {

// everything that survives between frames; owned by one change_tracer
struct tracer_state {
  // `log_path` is the session log resolved by prepare_session(), which may differ from config.log_path
  tracer_state(const tracer_config& config, const std::filesystem::path& log_path);

  std::vector<region_scanner> scanners;
  frequency_window frequencies;
  key_history keys;
  frame_set_sync frame_sets;
  event_log log;
};

} // namespace r4mw4tch
