#include "r4mw4tch/tracer/change_tracer.hpp"

#include <exception>

#include "r4mbase/format_utils.hpp"
#include "r4mw4tch/io/change_event.hpp"
#include "r4mw4tch/io/csv.hpp"
#include "r4mw4tch/io/session_files.hpp"

namespace r4mw4tch {

change_tracer::change_tracer(tracer_config config, frame_host& host) : config_(std::move(config)), host_(host) {}

trace_status change_tracer::start() {
  if (active_) {
    return ok_status();
  }

  if (auto status = config_.validate(); !status.ok()) {
    log_.err("rejected tracer config", redlog::field("error", status.message));
    report(diagnostic_kind::config_rejected, 0, status.message);
    return status;
  }

  uint64_t now = 0;
  try {
    now = host_.timestamp_ms();
  } catch (const std::exception& e) {
    log_.wrn("host clock unavailable, using wall clock", redlog::field("error", e.what()));
    now = util::now_epoch_ms();
  }

  // session files first: a log that cannot be rotated moves this session to a fresh file
  auto prepared = prepare_session(config_.log_path, config_.snapshot_dir, now, config_.write_header);

  state_ = std::make_unique<tracer_state>(config_, prepared.value.log_path);
  changes_.reserve(256);
  active_ = true;
  shut_down_ = false;

  for (const auto& scanner : state_->scanners) {
    log_.vrb(
        "watching region", redlog::field("name", scanner.region().name),
        redlog::field("base", "0x%08x", scanner.region().base_address),
        redlog::field("size", "0x%08x", scanner.region().size),
        redlog::field("chunk_size", "0x%08x", scanner.cursor().chunk_size()),
        redlog::field("chunks", scanner.cursor().chunk_count())
    );
  }

  if (!prepared.value.rotation_error.empty()) {
    stats_.io_failures++;
    report(
        diagnostic_kind::io_failure, 0,
        prepared.value.rotation_error + ", logging to " + prepared.value.log_path.string()
    );
  }

  if (!prepared.ok()) {
    stats_.io_failures++;
    log_.err("failed to prepare session files", redlog::field("error", prepared.status.message));
    report(diagnostic_kind::io_failure, 0, prepared.status.message);
    return prepared.status;
  }

  log_.inf(
      "tracer started", redlog::field("log", prepared.value.log_path.string()),
      redlog::field("snapshots", config_.snapshot_dir.string()), redlog::field("regions", config_.regions.size()),
      redlog::field("chunks", config_.chunk_count)
  );
  return ok_status();
}

void change_tracer::on_frame(uint64_t frame) {
  if (!active_) {
    return;
  }

  try {
    trace_frame(frame);
  } catch (const std::exception& e) {
    contain_fault(frame, e.what());
  } catch (...) {
    contain_fault(frame, "non-standard exception");
  }
}

void change_tracer::trace_frame(uint64_t frame) {
  stats_.frames_seen++;
  if (frame % config_.frame_skip != 0) {
    return;
  }
  stats_.frames_traced++;

  tracer_state& state = *state_;

  std::string current_keys;
  if (auto keys = host_.pressed_keys()) {
    current_keys = keys->joined();
  } else {
    if (stats_.key_defaults++ == 0) {
      report(diagnostic_kind::host_default, frame, "input state unavailable, recording keys as None");
    }
  }
  state.keys.push(current_keys);
  std::string last_keys = state.keys.last(config_.last_keys_count);

  uint32_t pc = 0;
  if (auto value = host_.program_counter()) {
    pc = *value;
  } else {
    if (stats_.pc_defaults++ == 0) {
      report(diagnostic_kind::host_default, frame, "program counter unavailable, recording 0");
    }
  }

  uint64_t timestamp = host_.timestamp_ms();
  uint64_t frame_set_id = state.frame_sets.current_id();

  // scan every region before moving any cursor so a fault leaves them in step
  for (auto& scanner : state.scanners) {
    changes_.clear();
    chunk_scan scan = scanner.scan_current(host_, changes_);
    stats_.chunks_scanned++;
    stats_.words_scanned += scan.words_scanned;
    emit_changes(scanner, scan, changes_, frame, last_keys, current_keys, pc, timestamp, frame_set_id);
  }

  size_t wrapped = 0;
  for (auto& scanner : state.scanners) {
    if (scanner.advance()) {
      wrapped++;
    }
  }

  sync_outcome outcome = state.frame_sets.observe(wrapped);
  if (outcome.state == sync_state::set_complete) {
    complete_frame_set(frame, outcome);
  } else if (outcome.state == sync_state::desynchronized) {
    report(
        diagnostic_kind::desynchronized, frame,
        std::to_string(wrapped) + " of " + std::to_string(state.scanners.size()) + " regions wrapped"
    );
  }

  if (config_.safety_flush_frames > 0 && stats_.frames_traced % config_.safety_flush_frames == 0) {
    forced_flush(frame);
  }
}

void change_tracer::emit_changes(
    const region_scanner& scanner, const chunk_scan& scan, const std::vector<word_change>& changes, uint64_t frame,
    const std::string& last_keys, const std::string& current_keys, uint32_t pc, uint64_t timestamp,
    uint64_t frame_set_id
) {
  tracer_state& state = *state_;

  for (const auto& change : changes) {
    change_event event;
    event.timestamp_ms = timestamp;
    event.region = scanner.region().name;
    event.frame = frame;
    event.address = change.address;
    event.prev_val = change.previous;
    event.curr_val = change.current;
    event.freq = state.frequencies.record(change.address, frame);
    event.pc = pc;
    event.last_keys = last_keys;
    event.current_keys = current_keys;
    event.frame_set_id = frame_set_id;
    event.chunk_id = scan.span.index;

    stats_.change_events++;

    trace_status status = state.log.append(csv::format_event(event));
    if (!status.ok()) {
      stats_.io_failures++;
      report(diagnostic_kind::io_failure, frame, status.message);
    }
  }
}

void change_tracer::complete_frame_set(uint64_t frame, const sync_outcome& outcome) {
  stats_.frame_sets_completed++;

  bool captured = false;
  std::string failure;
  try {
    captured = host_.capture_screenshot(outcome.screenshot_path);
    if (!captured) {
      failure = "host reported no screenshot for " + outcome.screenshot_path;
    }
  } catch (const std::exception& e) {
    failure = std::string("screenshot failed: ") + e.what();
  }

  if (!captured) {
    stats_.screenshots_failed++;
    log_.wrn(
        "frame set screenshot missing", redlog::field("frame_set_id", outcome.frame_set_id),
        redlog::field("error", failure)
    );
    report(diagnostic_kind::screenshot_failure, frame, failure);
    return;
  }

  log_.dbg(
      "captured frame set screenshot", redlog::field("frame_set_id", outcome.frame_set_id),
      redlog::field("frame", frame), redlog::field("path", outcome.screenshot_path)
  );
}

void change_tracer::contain_fault(uint64_t frame, const std::string& what) {
  stats_.frame_faults++;
  log_.err("fault while tracing frame", redlog::field("frame", frame), redlog::field("error", what));
  report(diagnostic_kind::frame_fault, frame, what);

  try {
    forced_flush(frame);
  } catch (const std::exception& e) {
    log_.err("flush after fault failed", redlog::field("frame", frame), redlog::field("error", e.what()));
  }
}

trace_status change_tracer::forced_flush(uint64_t frame) {
  if (!state_) {
    return ok_status();
  }

  stats_.forced_flushes++;
  trace_status status = state_->log.flush();
  if (!status.ok()) {
    stats_.io_failures++;
    report(diagnostic_kind::io_failure, frame, status.message);
  }
  return status;
}

trace_status change_tracer::flush() { return forced_flush(stats_.frames_seen); }

void change_tracer::on_shutdown() {
  if (!active_ || shut_down_) {
    return;
  }
  shut_down_ = true;

  trace_status status = forced_flush(stats_.frames_seen);
  if (!status.ok()) {
    log_.err(
        "final flush failed", redlog::field("error", status.message),
        redlog::field("buffered", state_->log.buffered())
    );
  }

  const auto& log_stats = state_->log.stats();
  log_.inf(
      "tracer shutdown", redlog::field("frames", stats_.frames_traced),
      redlog::field("events", util::format_number(stats_.change_events)),
      redlog::field("written", util::format_number(log_stats.lines_written)),
      redlog::field("frame_sets", stats_.frame_sets_completed), redlog::field("faults", stats_.frame_faults)
  );

  active_ = false;
}

void change_tracer::report(diagnostic_kind kind, uint64_t frame, std::string message) {
  if (!sink_) {
    return;
  }

  trace_diagnostic diagnostic{kind, frame, std::move(message)};
  try {
    sink_(diagnostic);
  } catch (const std::exception& e) {
    log_.wrn("diagnostic sink threw", redlog::field("error", e.what()));
  }
}

} // namespace r4mw4tch
