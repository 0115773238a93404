#include <doctest/doctest.h>

#include "r4mw4tch/stats/frequency_window.hpp"

TEST_CASE("frequency window counts changes inside the window") {
  r4mw4tch::frequency_window window(100);

  uint32_t count = 0;
  for (uint64_t frame = 1; frame <= 150; ++frame) {
    count = window.record(0x03000010, frame);
  }

  CHECK(count == 100);
  CHECK(window.windowed_count(0x03000010) == 100);
  CHECK(window.lifetime_count(0x03000010) == 150);
}

TEST_CASE("frequency window drops frames at or before the cutoff") {
  r4mw4tch::frequency_window window(100);

  CHECK(window.record(0x10, 5) == 1);
  CHECK(window.record(0x10, 104) == 2);
  CHECK(window.record(0x10, 105) == 2);
  CHECK(window.record(0x10, 300) == 1);
}

TEST_CASE("frequency window keeps addresses independent") {
  r4mw4tch::frequency_window window(10);

  window.record(0x10, 1);
  window.record(0x10, 2);
  window.record(0x20, 2);

  CHECK(window.windowed_count(0x10) == 2);
  CHECK(window.windowed_count(0x20) == 1);
  CHECK(window.windowed_count(0x30) == 0);
  CHECK(window.tracked_addresses() == 2);
}

TEST_CASE("frequency window restarts an address after a rewind") {
  r4mw4tch::frequency_window window(100);

  window.record(0x10, 50);
  window.record(0x10, 60);
  CHECK(window.record(0x10, 10) == 1);
  CHECK(window.lifetime_count(0x10) == 3);
}
