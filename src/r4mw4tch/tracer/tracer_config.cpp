#include "r4mw4tch/tracer/tracer_config.hpp"

#include "r4mbase/env_config.hpp"
#include "r4mbase/format_utils.hpp"
#include "r4mw4tch/scan/chunk_cursor.hpp"

namespace r4mw4tch {

tracer_config tracer_config::from_environment() {
  util::env_config loader("R4MW4TCH_");

  tracer_config config;
  config.log_path = loader.get<std::string>("LOG_PATH", config.log_path.string());
  config.snapshot_dir = loader.get<std::string>("SNAPSHOT_DIR", config.snapshot_dir.string());
  config.chunk_count = loader.get<uint32_t>("CHUNKS", config.chunk_count);
  config.window_frames = loader.get<uint64_t>("WINDOW", config.window_frames);
  config.flush_threshold = static_cast<size_t>(loader.get<uint64_t>("FLUSH_THRESHOLD", config.flush_threshold));
  config.key_history_capacity =
      static_cast<size_t>(loader.get<uint64_t>("KEY_HISTORY", config.key_history_capacity));
  config.last_keys_count = static_cast<size_t>(loader.get<uint64_t>("LAST_KEYS", config.last_keys_count));
  config.frame_skip = loader.get<uint64_t>("FRAME_SKIP", config.frame_skip);
  config.safety_flush_frames = loader.get<uint64_t>("SAFETY_FLUSH", config.safety_flush_frames);
  config.write_header = loader.get<bool>("CSV_HEADER", config.write_header);
  config.verbose = loader.get<int>("VERBOSE", config.verbose);

  return config;
}

trace_status tracer_config::validate() const {
  if (log_path.empty()) {
    return make_status(error_code::invalid_argument, "log path is empty");
  }
  if (regions.empty()) {
    return make_status(error_code::invalid_argument, "no memory regions configured");
  }
  if (chunk_count == 0) {
    return make_status(error_code::invalid_argument, "chunk count must be positive");
  }
  if (window_frames == 0) {
    return make_status(error_code::invalid_argument, "frequency window must be positive");
  }
  if (flush_threshold == 0) {
    return make_status(error_code::invalid_argument, "flush threshold must be positive");
  }
  if (key_history_capacity == 0) {
    return make_status(error_code::invalid_argument, "key history capacity must be positive");
  }
  if (frame_skip == 0) {
    return make_status(error_code::invalid_argument, "frame skip must be positive");
  }

  uint32_t expected_chunks = 0;
  for (const auto& region : regions) {
    if (region.size == 0 || region.size % word_size != 0) {
      return make_status(
          error_code::invalid_argument, "region " + region.name + " size must be a positive multiple of 4"
      );
    }
    if (region.base_address % word_size != 0) {
      return make_status(error_code::invalid_argument, "region " + region.name + " base must be word aligned");
    }
    if (static_cast<uint64_t>(region.base_address) + region.size > 0x100000000ull) {
      return make_status(
          error_code::invalid_argument,
          "region " + region.name + " at " + util::format_address(region.base_address) + " exceeds 32-bit space"
      );
    }

    // cursors must wrap on the same frame for frame sets to line up
    uint32_t chunks = chunks_per_pass(region.size, compute_chunk_size(region.size, chunk_count));
    if (expected_chunks == 0) {
      expected_chunks = chunks;
    } else if (chunks != expected_chunks) {
      return make_status(
          error_code::invalid_argument, "region " + region.name + " needs " + std::to_string(chunks) +
                                            " chunks per pass, other regions need " + std::to_string(expected_chunks)
      );
    }
  }

  return ok_status();
}

} // namespace r4mw4tch
