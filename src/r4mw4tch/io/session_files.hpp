#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>

#include <redlog.hpp>

#include "r4mw4tch/core/trace_result.hpp"

namespace r4mw4tch {

struct session_layout {
  std::filesystem::path log_path; // where this session's events go
  std::filesystem::path snapshot_dir;
  std::optional<std::filesystem::path> rotated_log; // where the previous session's log went
  size_t snapshots_removed = 0;
  // set when the previous log could not be moved; log_path then names a fresh file
  std::string rotation_error;
};

using rename_function =
    std::function<void(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec)>;

/**
 * @brief name for a rotated log: `<stem>_<YYYYmmdd_HHMMSS><ext>` beside the original
 *
 * a numeric suffix is appended when that name is already taken.
 */
std::filesystem::path rotated_log_path(const std::filesystem::path& log_path, uint64_t now_ms);

/**
 * @brief unused `<stem>_<YYYYmmdd_HHMMSS>_session<ext>` beside `log_path`
 *
 * the new session writes here when the previous log cannot be rotated away.
 */
std::filesystem::path fresh_log_path(const std::filesystem::path& log_path, uint64_t now_ms);

/**
 * @brief prepares the files of a new tracing session
 *
 * creates the log and snapshot directories, renames a log left by a previous
 * session, empties the snapshot directory and, when `write_header` is set,
 * starts the fresh log with the csv header row. a log that cannot be renamed
 * is left untouched and the session is redirected to fresh_log_path(); the
 * result is still ok and `rotation_error` says why.
 */
trace_result<session_layout> prepare_session(
    const std::filesystem::path& log_path, const std::filesystem::path& snapshot_dir, uint64_t now_ms,
    bool write_header, const rename_function& rename = {}
);

} // namespace r4mw4tch
