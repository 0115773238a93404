#include <doctest/doctest.h>

#include <fstream>
#include <system_error>

#include "r4mw4tch/io/csv.hpp"
#include "r4mw4tch/io/session_files.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

using r4mw4tch::test::read_lines;
using r4mw4tch::test::temp_dir;

TEST_CASE("session setup creates directories and writes the header") {
  temp_dir dir("session_fresh");
  fs::path log_path = dir.path() / "event_logs" / "events.csv";
  fs::path snapshots = dir.path() / "snapshots";

  auto prepared = r4mw4tch::prepare_session(log_path, snapshots, 1700000000000, true);
  REQUIRE(prepared.ok());
  CHECK_FALSE(prepared.value.rotated_log.has_value());
  CHECK(fs::is_directory(snapshots));

  auto lines = read_lines(log_path);
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == r4mw4tch::csv::event_header);
}

TEST_CASE("session setup rotates an existing log and clears old snapshots") {
  temp_dir dir("session_rotate");
  fs::path log_path = dir.path() / "events.csv";
  fs::path snapshots = dir.path() / "snapshots";
  fs::create_directories(snapshots);

  std::ofstream(log_path) << "previous session\n";
  std::ofstream(snapshots / "0.png") << "old";
  std::ofstream(snapshots / "1.png") << "old";

  auto prepared = r4mw4tch::prepare_session(log_path, snapshots, 1700000000000, false);
  REQUIRE(prepared.ok());
  REQUIRE(prepared.value.rotated_log.has_value());
  CHECK(prepared.value.snapshots_removed == 2);
  CHECK(fs::is_empty(snapshots));
  CHECK_FALSE(fs::exists(log_path));

  auto rotated = *prepared.value.rotated_log;
  CHECK(rotated.parent_path() == log_path.parent_path());
  CHECK(rotated.extension() == ".csv");
  CHECK(rotated.stem().string().rfind("events_", 0) == 0);
  CHECK(read_lines(rotated).front() == "previous session");
}

TEST_CASE("rotated log names never overwrite an earlier rotation") {
  temp_dir dir("session_collision");
  fs::path log_path = dir.path() / "events.csv";

  fs::path first = r4mw4tch::rotated_log_path(log_path, 1700000000000);
  std::ofstream(first) << "taken";
  fs::path second = r4mw4tch::rotated_log_path(log_path, 1700000000000);

  CHECK(first != second);
  CHECK(second.stem().string() == first.stem().string() + "_1");
}

TEST_CASE("session setup leaves an unrenamable log alone and starts a fresh one") {
  temp_dir dir("session_rename_fails");
  fs::path log_path = dir.path() / "events.csv";
  fs::path snapshots = dir.path() / "snapshots";
  fs::create_directories(snapshots);

  std::ofstream(log_path) << "previous session\n";
  std::ofstream(snapshots / "0.png") << "old";

  auto refuse = [](const fs::path&, const fs::path&, std::error_code& ec) {
    ec = std::make_error_code(std::errc::permission_denied);
  };
  auto prepared = r4mw4tch::prepare_session(log_path, snapshots, 1700000000000, true, refuse);
  REQUIRE(prepared.ok());
  CHECK_FALSE(prepared.value.rotated_log.has_value());
  CHECK_FALSE(prepared.value.rotation_error.empty());

  // stale snapshots are cleared even though the log stayed put
  CHECK(prepared.value.snapshots_removed == 1);
  CHECK(fs::is_directory(snapshots));
  CHECK(fs::is_empty(snapshots));

  auto previous = read_lines(log_path);
  REQUIRE(previous.size() == 1);
  CHECK(previous[0] == "previous session");

  fs::path fresh = prepared.value.log_path;
  CHECK(fresh != log_path);
  CHECK(fresh.parent_path() == log_path.parent_path());
  CHECK(fresh.extension() == ".csv");
  CHECK(fresh.stem().string().rfind("events_", 0) == 0);

  auto lines = read_lines(fresh);
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == r4mw4tch::csv::event_header);
}
