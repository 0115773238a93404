#include "r4mw4tch/tracer/tracer_state.hpp"

namespace r4mw4tch {

tracer_state::tracer_state(const tracer_config& config, const std::filesystem::path& log_path)
    : frequencies(config.window_frames), keys(config.key_history_capacity),
      frame_sets(config.snapshot_dir, config.regions.size()),
      log(event_log_config{log_path, config.flush_threshold}) {
  scanners.reserve(config.regions.size());
  for (const auto& region : config.regions) {
    scanners.emplace_back(region, config.chunk_count);
  }
}

} // namespace r4mw4tch
