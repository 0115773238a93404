#include <doctest/doctest.h>

#include <filesystem>

#include "r4mw4tch/sync/frame_set_sync.hpp"

using r4mw4tch::frame_set_sync;
using r4mw4tch::sync_state;

TEST_CASE("frame set completes only when every region wraps together") {
  frame_set_sync sync("snapshots", 2);

  for (int frame = 0; frame < 4; ++frame) {
    auto outcome = sync.observe(0);
    CHECK(outcome.state == sync_state::scanning);
    CHECK(outcome.frame_set_id == 0);
  }

  auto done = sync.observe(2);
  CHECK(done.state == sync_state::set_complete);
  CHECK(done.frame_set_id == 0);
  CHECK(done.screenshot_path == (std::filesystem::path("snapshots") / "0.png").string());
  CHECK(sync.current_id() == 1);
  CHECK(sync.sets_completed() == 1);
  CHECK(sync.frames_in_set() == 0);
}

TEST_CASE("frame set reports a partial wrap without advancing") {
  frame_set_sync sync("snapshots", 2, 7);

  auto outcome = sync.observe(1);
  CHECK(outcome.state == sync_state::desynchronized);
  CHECK(outcome.screenshot_path.empty());
  CHECK(sync.current_id() == 7);
  CHECK(sync.sets_completed() == 0);
}

TEST_CASE("frame set ids increase by one per completed set") {
  frame_set_sync sync("shots", 2);

  uint64_t completed = 0;
  for (int frame = 1; frame <= 20; ++frame) {
    auto outcome = sync.observe(frame % 5 == 0 ? 2 : 0);
    if (outcome.state == sync_state::set_complete) {
      CHECK(outcome.frame_set_id == completed);
      completed++;
    }
  }

  CHECK(completed == 4);
  CHECK(sync.screenshot_path(3) == (std::filesystem::path("shots") / "3.png").string());
}
