#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "r4mw4tch/core/trace_result.hpp"
#include "r4mw4tch/host/frame_host.hpp"
#include "r4mw4tch/scan/region_scanner.hpp"
#include "r4mw4tch/tracer/diagnostics.hpp"
#include "r4mw4tch/tracer/tracer_config.hpp"
#include "r4mw4tch/tracer/tracer_state.hpp"

namespace r4mw4tch {

/**
 * @brief frame-driven memory change tracer
 *
 * the embedding host calls start() once, on_frame() after every rendered
 * frame and on_shutdown() before exit. on_frame() scans one chunk of every
 * region, logs each changed word, and captures a screenshot when all regions
 * complete a pass together. it never throws: faults inside a frame are
 * reported, the buffered log is flushed, and the next frame proceeds normally.
 */
class change_tracer {
public:
  change_tracer(tracer_config config, frame_host& host);

  change_tracer(const change_tracer&) = delete;
  change_tracer& operator=(const change_tracer&) = delete;

  // validates the config and prepares session files; file errors leave the tracer running
  trace_status start();

  void on_frame(uint64_t frame);

  // forced flush and final statistics; further frames are ignored
  void on_shutdown();

  trace_status flush();

  void set_diagnostic_sink(diagnostic_sink sink) { sink_ = std::move(sink); }

  bool is_active() const { return active_; }
  const tracer_config& config() const { return config_; }
  const tracer_stats& stats() const { return stats_; }
  // null until start() succeeds
  const tracer_state* state() const { return state_.get(); }
  // file this session appends to; differs from config().log_path when the previous log could not be rotated
  std::filesystem::path log_path() const { return state_ ? state_->log.path() : config_.log_path; }

private:
  void trace_frame(uint64_t frame);
  void emit_changes(
      const region_scanner& scanner, const chunk_scan& scan, const std::vector<word_change>& changes, uint64_t frame,
      const std::string& last_keys, const std::string& current_keys, uint32_t pc, uint64_t timestamp,
      uint64_t frame_set_id
  );
  void complete_frame_set(uint64_t frame, const sync_outcome& outcome);
  void contain_fault(uint64_t frame, const std::string& what);
  trace_status forced_flush(uint64_t frame);
  void report(diagnostic_kind kind, uint64_t frame, std::string message);

  tracer_config config_;
  frame_host& host_;
  std::unique_ptr<tracer_state> state_;
  std::vector<word_change> changes_;
  tracer_stats stats_{};
  diagnostic_sink sink_;
  bool active_ = false;
  bool shut_down_ = false;
  redlog::logger log_ = redlog::get_logger("r4mw4tch.tracer");
};

} // namespace r4mw4tch
