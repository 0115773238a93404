#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "r4mw4tch/core/trace_result.hpp"
#include "r4mw4tch/input/key_history.hpp"
#include "r4mw4tch/io/event_log.hpp"
#include "r4mw4tch/region/memory_region.hpp"
#include "r4mw4tch/stats/frequency_window.hpp"

namespace r4mw4tch {

constexpr uint32_t default_chunk_count = 5;

struct tracer_config {
  std::filesystem::path log_path = "event_logs/events.csv";
  std::filesystem::path snapshot_dir = "snapshots";
  std::vector<memory_region> regions = regions::default_catalog();

  uint32_t chunk_count = default_chunk_count;
  uint64_t window_frames = default_frequency_window;
  size_t flush_threshold = default_flush_threshold;
  size_t key_history_capacity = default_key_history_capacity;
  size_t last_keys_count = default_last_keys_count;

  // trace only frames where frame % frame_skip == 0
  uint64_t frame_skip = 1;
  // forced flush every n traced frames, 0 disables
  uint64_t safety_flush_frames = 0;
  // the event log carries no header row unless asked for
  bool write_header = false;
  int verbose = 0;

  // defaults overridden by R4MW4TCH_* environment variables
  static tracer_config from_environment();

  trace_status validate() const;
};

} // namespace r4mw4tch
