#include <doctest/doctest.h>

#include <cstdlib>

#include "r4mw4tch/tracer/tracer_config.hpp"

using r4mw4tch::memory_region;
using r4mw4tch::tracer_config;

TEST_CASE("default tracer config watches iwram then ewram") {
  tracer_config config;
  CHECK(config.validate().ok());
  REQUIRE(config.regions.size() == 2);
  CHECK(config.regions[0].name == "iwram");
  CHECK(config.regions[0].base_address == 0x03000000);
  CHECK(config.regions[0].size == 0x8000);
  CHECK(config.regions[1].name == "ewram");
  CHECK(config.regions[1].base_address == 0x02000000);
  CHECK(config.regions[1].size == 0x40000);
  CHECK(config.chunk_count == 5);
  CHECK(config.window_frames == 100);
  CHECK(config.flush_threshold == 200);
  CHECK_FALSE(config.write_header);
}

TEST_CASE("tracer config rejects zero sized settings") {
  tracer_config config;
  config.window_frames = 0;
  CHECK_FALSE(config.validate().ok());

  config = tracer_config{};
  config.flush_threshold = 0;
  CHECK_FALSE(config.validate().ok());

  config = tracer_config{};
  config.frame_skip = 0;
  CHECK_FALSE(config.validate().ok());

  config = tracer_config{};
  config.regions.clear();
  CHECK_FALSE(config.validate().ok());
}

TEST_CASE("tracer config rejects misaligned and out of range regions") {
  tracer_config config;
  config.regions = {memory_region{"odd", 0x03000000, 0x8002}};
  CHECK_FALSE(config.validate().ok());

  config.regions = {memory_region{"shifted", 0x03000002, 0x8000}};
  CHECK_FALSE(config.validate().ok());

  config.regions = {memory_region{"high", 0xFFFFFF00, 0x200}};
  CHECK_FALSE(config.validate().ok());
}

TEST_CASE("tracer config rejects regions that cannot wrap together") {
  tracer_config config;
  config.chunk_count = 8;
  config.regions = {memory_region{"tiny", 0x1000, 16}, memory_region{"large", 0x2000, 0x1000}};

  auto status = config.validate();
  CHECK(status.code == r4mw4tch::error_code::invalid_argument);
  CHECK(status.message.find("large") != std::string::npos);
}

#if !defined(_WIN32)
TEST_CASE("tracer config reads overrides from the environment") {
  setenv("R4MW4TCH_CHUNKS", "10", 1);
  setenv("R4MW4TCH_WINDOW", "30", 1);
  setenv("R4MW4TCH_CSV_HEADER", "true", 1);
  setenv("R4MW4TCH_LOG_PATH", "custom/log.csv", 1);

  auto config = tracer_config::from_environment();
  CHECK(config.chunk_count == 10);
  CHECK(config.window_frames == 30);
  CHECK(config.write_header);
  CHECK(config.log_path == "custom/log.csv");
  CHECK(config.flush_threshold == 200);

  unsetenv("R4MW4TCH_CHUNKS");
  unsetenv("R4MW4TCH_WINDOW");
  unsetenv("R4MW4TCH_CSV_HEADER");
  unsetenv("R4MW4TCH_LOG_PATH");
}
#endif
