#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "r4mw4tch/core/trace_result.hpp"

namespace r4mw4tch {

constexpr size_t default_flush_threshold = 200;

struct event_log_config {
  std::filesystem::path path;
  size_t flush_threshold = default_flush_threshold;
};

struct event_log_stats {
  uint64_t lines_appended = 0;
  uint64_t lines_written = 0;
  uint64_t flushes = 0;
  uint64_t failed_flushes = 0;
};

/**
 * @brief buffered append-only writer for formatted event records
 *
 * lines accumulate in memory until the buffer reaches the flush threshold.
 * each flush opens the file in append mode, writes every buffered line and
 * closes it again, so data is on disk as soon as a flush returns ok. a failed
 * flush keeps the buffer, truncates any partial write off a regular file, and
 * re-arms the next attempt one threshold later.
 */
class event_log {
public:
  explicit event_log(event_log_config config);
  ~event_log() = default;

  event_log(const event_log&) = delete;
  event_log& operator=(const event_log&) = delete;

  // queues one record (no trailing newline); returns the status of any flush it triggered
  trace_status append(std::string line);

  // writes everything buffered regardless of the threshold
  trace_status flush();

  size_t buffered() const { return lines_.size(); }
  size_t next_flush_at() const { return next_flush_at_; }
  const event_log_stats& stats() const { return stats_; }
  const std::filesystem::path& path() const { return config_.path; }

private:
  event_log_config config_;
  std::vector<std::string> lines_;
  size_t next_flush_at_;
  event_log_stats stats_{};
  redlog::logger log_ = redlog::get_logger("r4mw4tch.event_log");
};

} // namespace r4mw4tch
