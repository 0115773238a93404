#include "r4mw4tch/io/session_files.hpp"

#include <fstream>
#include <system_error>

#include "r4mbase/time_utils.hpp"
#include "r4mw4tch/io/csv.hpp"

namespace r4mw4tch {

namespace fs = std::filesystem;

namespace {

redlog::logger log_session = redlog::get_logger("r4mw4tch.session");

trace_status ensure_directory(const fs::path& dir) {
  if (dir.empty()) {
    return ok_status();
  }

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return make_status(error_code::io_error, "cannot create " + dir.string() + ": " + ec.message());
  }
  return ok_status();
}

trace_result<size_t> clear_directory(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return ok_result<size_t>(0);
  }

  size_t removed = 0;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code remove_ec;
    fs::remove_all(it->path(), remove_ec);
    if (remove_ec) {
      return error_result<size_t>(
          error_code::io_error, "cannot remove " + it->path().string() + ": " + remove_ec.message()
      );
    }
    removed++;
  }

  if (ec) {
    return error_result<size_t>(error_code::io_error, "cannot list " + dir.string() + ": " + ec.message());
  }
  return ok_result(removed);
}

// first `<base>[_N]<ext>` beside `log_path` that does not exist yet
fs::path unused_sibling(const fs::path& log_path, const std::string& base) {
  std::string ext = log_path.extension().string();

  fs::path candidate = log_path.parent_path() / (base + ext);
  std::error_code ec;
  for (int attempt = 1; fs::exists(candidate, ec); ++attempt) {
    candidate = log_path.parent_path() / (base + "_" + std::to_string(attempt) + ext);
  }
  return candidate;
}

void rename_file(const fs::path& from, const fs::path& to, std::error_code& ec) { fs::rename(from, to, ec); }

} // namespace

fs::path rotated_log_path(const fs::path& log_path, uint64_t now_ms) {
  return unused_sibling(log_path, log_path.stem().string() + "_" + util::format_timestamp_suffix(now_ms));
}

fs::path fresh_log_path(const fs::path& log_path, uint64_t now_ms) {
  return unused_sibling(
      log_path, log_path.stem().string() + "_" + util::format_timestamp_suffix(now_ms) + "_session"
  );
}

trace_result<session_layout> prepare_session(
    const fs::path& log_path, const fs::path& snapshot_dir, uint64_t now_ms, bool write_header,
    const rename_function& rename
) {
  session_layout layout;
  layout.log_path = log_path;
  layout.snapshot_dir = snapshot_dir;

  if (auto status = ensure_directory(log_path.parent_path()); !status.ok()) {
    return {layout, status};
  }

  std::error_code ec;
  if (fs::exists(log_path, ec)) {
    fs::path rotated = rotated_log_path(log_path, now_ms);
    if (rename) {
      rename(log_path, rotated, ec);
    } else {
      rename_file(log_path, rotated, ec);
    }

    if (ec) {
      // never append to the previous session's log
      layout.rotation_error = "cannot rotate " + log_path.string() + ": " + ec.message();
      layout.log_path = fresh_log_path(log_path, now_ms);
      log_session.wrn(
          "previous event log left in place", redlog::field("log", log_path.string()),
          redlog::field("error", ec.message()), redlog::field("session_log", layout.log_path.string())
      );
    } else {
      layout.rotated_log = rotated;
      log_session.inf(
          "rotated previous event log", redlog::field("from", log_path.string()),
          redlog::field("to", rotated.string())
      );
    }
  }

  auto cleared = clear_directory(snapshot_dir);
  if (!cleared.ok()) {
    return {layout, cleared.status};
  }
  layout.snapshots_removed = cleared.value;
  if (cleared.value > 0) {
    log_session.inf(
        "cleared stale snapshots", redlog::field("dir", snapshot_dir.string()), redlog::field("removed", cleared.value)
    );
  }

  if (auto status = ensure_directory(snapshot_dir); !status.ok()) {
    return {layout, status};
  }

  if (write_header) {
    std::ofstream out(layout.log_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
      return {layout, make_status(error_code::io_error, "cannot create " + layout.log_path.string())};
    }
    out << csv::event_header << '\n';
    out.flush();
    if (!out) {
      return {layout, make_status(error_code::io_error, "cannot write header to " + layout.log_path.string())};
    }
  }

  return {layout, ok_status()};
}

} // namespace r4mw4tch
