#include "replay.hpp"

#include <iostream>

#include <redlog.hpp>

#include "r4mbase/format_utils.hpp"
#include "r4mbase/signal_handler.hpp"
#include "r4mtool/replay_host.hpp"
#include "r4mw4tch/tracer/change_tracer.hpp"

namespace r4mtool::commands {

int replay(
    args::ValueFlag<std::string>& frames_flag, args::ValueFlag<std::string>& output_flag,
    args::ValueFlag<std::string>& snapshots_flag, args::ValueFlag<uint32_t>& chunks_flag,
    args::ValueFlag<uint64_t>& window_flag, args::ValueFlag<size_t>& flush_threshold_flag,
    args::ValueFlag<uint64_t>& frame_skip_flag, args::ValueFlag<uint64_t>& limit_flag, args::Flag& header_flag,
    int verbosity
) {
  auto log = redlog::get_logger("r4mtool.replay");

  if (!frames_flag) {
    log.error("frame directory required (--frames)");
    return 1;
  }

  r4mw4tch::tracer_config config = r4mw4tch::tracer_config::from_environment();
  config.verbose = verbosity;
  if (output_flag) {
    config.log_path = args::get(output_flag);
  }
  if (snapshots_flag) {
    config.snapshot_dir = args::get(snapshots_flag);
  }
  if (chunks_flag) {
    config.chunk_count = args::get(chunks_flag);
  }
  if (window_flag) {
    config.window_frames = args::get(window_flag);
  }
  if (flush_threshold_flag) {
    config.flush_threshold = args::get(flush_threshold_flag);
  }
  if (frame_skip_flag) {
    config.frame_skip = args::get(frame_skip_flag);
  }
  if (header_flag) {
    config.write_header = true;
  }

  auto frames = discover_frames(args::get(frames_flag));
  if (!frames.ok()) {
    log.error("cannot read recorded frames", redlog::field("error", frames.status.message));
    return 1;
  }
  if (frames.value.empty()) {
    log.error("no frame directories found", redlog::field("dir", args::get(frames_flag)));
    return 1;
  }

  replay_host host(config.regions);
  r4mw4tch::change_tracer tracer(config, host);
  tracer.set_diagnostic_sink([&log](const r4mw4tch::trace_diagnostic& diagnostic) {
    log.vrb(
        "tracer diagnostic", redlog::field("kind", r4mw4tch::diagnostic_kind_name(diagnostic.kind)),
        redlog::field("frame", diagnostic.frame), redlog::field("message", diagnostic.message)
    );
  });

  r4mw4tch::trace_status started = tracer.start();
  if (!tracer.is_active()) {
    log.error("tracer failed to start", redlog::field("error", started.message));
    return 1;
  }

  // ctrl+c stops the loop; the tracer is flushed below on this thread, never from the handler
  r4mw4tch::signal_handler::config signal_config;
  signal_config.context_name = "r4mtool.replay";
  signal_config.log_signals = verbosity > 0;
  signal_config.defer = true;
  r4mw4tch::signal_handler::guard signals(signal_config);

  uint64_t limit = limit_flag ? args::get(limit_flag) : 0;
  uint64_t replayed = 0;
  uint64_t skipped = 0;

  log.inf(
      "replaying frames", redlog::field("count", frames.value.size()),
      redlog::field("first", frames.value.front().frame), redlog::field("last", frames.value.back().frame)
  );

  for (const auto& recorded : frames.value) {
    if (limit > 0 && replayed >= limit) {
      break;
    }
    if (r4mw4tch::signal_handler::interrupted()) {
      log.wrn("interrupted, stopping replay", redlog::field("replayed", replayed));
      break;
    }

    r4mw4tch::trace_status loaded = host.load(recorded.dir);
    if (!loaded.ok()) {
      skipped++;
      log.wrn("skipping frame", redlog::field("frame", recorded.frame), redlog::field("error", loaded.message));
      continue;
    }

    tracer.on_frame(recorded.frame);
    replayed++;
  }

  tracer.on_shutdown();

  const auto& stats = tracer.stats();
  std::cout << "=== Replay ===\n";
  std::cout << "frames replayed: " << r4mw4tch::util::format_number(replayed) << "\n";
  std::cout << "frames skipped: " << r4mw4tch::util::format_number(skipped) << "\n";
  std::cout << "change events: " << r4mw4tch::util::format_number(stats.change_events) << "\n";
  std::cout << "frame sets: " << r4mw4tch::util::format_number(stats.frame_sets_completed) << "\n";
  std::cout << "screenshots missing: " << stats.screenshots_failed << "\n";
  std::cout << "frame faults: " << stats.frame_faults << "\n";
  std::cout << "log: " << tracer.log_path().string() << "\n";

  if (const auto* state = tracer.state(); state && state->log.buffered() > 0) {
    log.error("event log still holds unwritten lines", redlog::field("lines", state->log.buffered()));
    return 1;
  }
  return 0;
}

} // namespace r4mtool::commands
