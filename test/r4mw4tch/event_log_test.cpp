#include <doctest/doctest.h>

#include <string>

#include "r4mw4tch/io/event_log.hpp"
#include "test_helpers.hpp"

using r4mw4tch::event_log;
using r4mw4tch::event_log_config;
using r4mw4tch::test::read_lines;
using r4mw4tch::test::temp_dir;

TEST_CASE("event log holds lines until the threshold is reached") {
  temp_dir dir("event_log_threshold");
  event_log log(event_log_config{dir.path() / "events.csv", 200});

  for (int i = 0; i < 199; ++i) {
    CHECK(log.append("line " + std::to_string(i)).ok());
  }
  CHECK(log.buffered() == 199);
  CHECK_FALSE(std::filesystem::exists(dir.path() / "events.csv"));

  CHECK(log.append("line 199").ok());
  CHECK(log.buffered() == 0);
  CHECK(log.stats().flushes == 1);

  auto lines = read_lines(dir.path() / "events.csv");
  REQUIRE(lines.size() == 200);
  CHECK(lines.front() == "line 0");
  CHECK(lines.back() == "line 199");
}

TEST_CASE("event log appends across flushes in arrival order") {
  temp_dir dir("event_log_order");
  event_log log(event_log_config{dir.path() / "events.csv", 2});

  log.append("a");
  log.append("b");
  log.append("c");
  CHECK(log.buffered() == 1);
  CHECK(log.flush().ok());
  CHECK(log.flush().ok());

  auto lines = read_lines(dir.path() / "events.csv");
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "a");
  CHECK(lines[2] == "c");
  CHECK(log.stats().lines_written == 3);
}

TEST_CASE("event log keeps the buffer when the file cannot be opened") {
  temp_dir dir("event_log_failure");
  // a directory in place of the log file makes every open fail
  std::filesystem::create_directories(dir.path() / "events.csv");
  event_log log(event_log_config{dir.path() / "events.csv", 3});

  log.append("a");
  log.append("b");
  auto status = log.append("c");
  CHECK_FALSE(status.ok());
  CHECK(status.code == r4mw4tch::error_code::io_error);
  CHECK(log.buffered() == 3);
  CHECK(log.stats().failed_flushes == 1);
  CHECK(log.next_flush_at() == 6);

  // the retry happens one threshold later, not on every append
  CHECK(log.append("d").ok());
  CHECK(log.stats().failed_flushes == 1);

  std::filesystem::remove(dir.path() / "events.csv");
  CHECK(log.flush().ok());
  CHECK(log.buffered() == 0);
  CHECK(log.next_flush_at() == 3);
  CHECK(read_lines(dir.path() / "events.csv").size() == 4);
}

#if defined(__linux__)
TEST_CASE("event log keeps the buffer when a write fails after opening") {
  // /dev/full opens fine but every write reports ENOSPC
  if (!std::filesystem::exists("/dev/full")) {
    return;
  }
  event_log log(event_log_config{"/dev/full", 2});

  log.append("a");
  auto status = log.append("b");
  CHECK(status.code == r4mw4tch::error_code::io_error);
  CHECK(log.buffered() == 2);
  CHECK(log.stats().failed_flushes == 1);
  CHECK(log.stats().flushes == 0);
  CHECK(log.stats().lines_written == 0);
  CHECK(log.next_flush_at() == 4);

  CHECK_FALSE(log.flush().ok());
  CHECK(log.buffered() == 2);
  CHECK(log.stats().failed_flushes == 2);
}
#endif
