#include "r4mw4tch/io/event_log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

namespace r4mw4tch {

namespace {

size_t sanitize_threshold(size_t threshold) { return threshold == 0 ? 1 : threshold; }

// size of a regular file, or nothing for missing and special files
std::optional<uintmax_t> regular_file_size(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return size;
}

} // namespace

event_log::event_log(event_log_config config)
    : config_(std::move(config)), next_flush_at_(sanitize_threshold(config_.flush_threshold)) {
  config_.flush_threshold = sanitize_threshold(config_.flush_threshold);
  lines_.reserve(config_.flush_threshold);
}

trace_status event_log::append(std::string line) {
  lines_.push_back(std::move(line));
  stats_.lines_appended++;

  if (lines_.size() < next_flush_at_) {
    return ok_status();
  }
  return flush();
}

trace_status event_log::flush() {
  if (lines_.empty()) {
    return ok_status();
  }

  // a failed write is cut back to this size so a retry cannot duplicate lines
  std::optional<uintmax_t> size_before = regular_file_size(config_.path);

  std::ofstream out(config_.path, std::ios::out | std::ios::app | std::ios::binary);
  if (!out.is_open()) {
    stats_.failed_flushes++;
    next_flush_at_ = lines_.size() + config_.flush_threshold;

    std::string reason = std::strerror(errno);
    log_.wrn(
        "failed to open event log, keeping buffer", redlog::field("path", config_.path.string()),
        redlog::field("buffered", lines_.size()), redlog::field("error", reason)
    );
    return make_status(error_code::io_error, "cannot open " + config_.path.string() + ": " + reason);
  }

  std::string block;
  size_t total = 0;
  for (const auto& line : lines_) {
    total += line.size() + 1;
  }
  block.reserve(total);
  for (const auto& line : lines_) {
    block += line;
    block += '\n';
  }

  out.write(block.data(), static_cast<std::streamsize>(block.size()));
  out.flush();
  if (!out) {
    std::string reason = std::strerror(errno);
    out.close();

    stats_.failed_flushes++;
    next_flush_at_ = lines_.size() + config_.flush_threshold;

    std::error_code ec;
    uintmax_t rollback_to = size_before.value_or(0);
    if (auto size_after = regular_file_size(config_.path); size_after && *size_after != rollback_to) {
      std::filesystem::resize_file(config_.path, rollback_to, ec);
    }

    log_.wrn(
        "failed to write event log, keeping buffer", redlog::field("path", config_.path.string()),
        redlog::field("buffered", lines_.size()), redlog::field("error", reason)
    );
    if (ec) {
      log_.err(
          "failed to roll back partial write, log may hold a torn record",
          redlog::field("path", config_.path.string()), redlog::field("error", ec.message())
      );
      return make_status(
          error_code::io_error, "write failed for " + config_.path.string() + " and rollback failed: " + ec.message()
      );
    }
    return make_status(error_code::io_error, "write failed for " + config_.path.string());
  }

  stats_.flushes++;
  stats_.lines_written += lines_.size();

  log_.dbg("flushed event log", redlog::field("lines", lines_.size()), redlog::field("path", config_.path.string()));

  lines_.clear();
  next_flush_at_ = config_.flush_threshold;
  return ok_status();
}

} // namespace r4mw4tch
