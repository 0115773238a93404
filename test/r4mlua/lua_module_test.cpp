#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <string>

#include <sol/sol.hpp>

#include "r4mlua/lua_tracer.hpp"

namespace fs = std::filesystem;

namespace {

int open_r4mw4tch(lua_State* L) { return sol::stack::call_lua(L, 1, r4mw4tch::lua::open_module); }

fs::path scratch_dir() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return fs::temp_directory_path() / ("r4mw4tch_lua_" + std::to_string(static_cast<long long>(now)));
}

} // namespace

TEST_CASE("config table overrides tracer settings") {
  sol::state lua;
  sol::table options = lua.script(R"(
    return { log_path = "out/events.csv", chunks = 10, window = 50, csv_header = true, frame_skip = 3 }
  )");

  auto config = r4mw4tch::lua::config_from_table(options, r4mw4tch::tracer_config{});
  CHECK(config.log_path == "out/events.csv");
  CHECK(config.chunk_count == 10);
  CHECK(config.window_frames == 50);
  CHECK(config.write_header);
  CHECK(config.frame_skip == 3);
  CHECK(config.flush_threshold == 200);
}

TEST_CASE("lua module drives a tracer from script callbacks") {
  fs::path dir = scratch_dir();

  sol::state lua;
  lua.open_libraries(sol::lib::base, sol::lib::package, sol::lib::table, sol::lib::string);
  lua.require("r4mw4tch", open_r4mw4tch);
  lua["log_path"] = (dir / "events.csv").string();
  lua["snapshot_dir"] = (dir / "snapshots").string();

  lua.script(R"(
    local r4m = require("r4mw4tch")
    memory = {}
    shots = {}
    local host = {
      read_u32_le = function(addr) return memory[addr] or 0 end,
      read_bytes = function(addr, len)
        local out = {}
        for i = 0, len - 1, 4 do
          local word = memory[addr + i] or 0
          out[i] = word & 0xFF
          out[i + 1] = (word >> 8) & 0xFF
          out[i + 2] = (word >> 16) & 0xFF
          out[i + 3] = (word >> 24) & 0xFF
        end
        return out
      end,
      pc = function() return 0x08000100 end,
      keys = function() return { A = true } end,
      screenshot = function(path) shots[#shots + 1] = path return false end,
    }
    tracer = r4m.new(host, { log_path = log_path, snapshot_dir = snapshot_dir, flush_threshold = 1 })
    for frame = 1, 5 do tracer:on_frame(frame) end
    memory[0x03000020] = 0x2A
    tracer:on_frame(6)
    stats = tracer:stats()
    diagnostics = tracer:diagnostics()
    tracer:on_shutdown()
  )");

  sol::table stats = lua["stats"];
  CHECK(stats.get<uint64_t>("change_events") == 1);
  CHECK(stats.get<uint64_t>("frame_sets_completed") == 1);
  CHECK(stats.get<uint64_t>("lines_written") == 1);

  sol::table shots = lua["shots"];
  CHECK(shots.size() == 1);

  sol::table diagnostics = lua["diagnostics"];
  REQUIRE(diagnostics.size() == 1);
  sol::table first = diagnostics[1];
  CHECK(first.get<std::string>("kind") == "screenshot_failure");
  CHECK(first.get<uint64_t>("frame") == 5);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST_CASE("lua module raises when the host table is unusable") {
  sol::state lua;
  lua.open_libraries(sol::lib::base, sol::lib::package);
  lua.require("r4mw4tch", open_r4mw4tch);

  auto result = lua.safe_script(
      R"(
        local r4m = require("r4mw4tch")
        return r4m.new({})
      )",
      sol::script_pass_on_error
  );
  CHECK_FALSE(result.valid());
}

TEST_CASE("lua set_verbosity reports the level it applied") {
  sol::state lua;
  lua.open_libraries(sol::lib::base, sol::lib::package);
  lua.require("r4mw4tch", open_r4mw4tch);

  std::string applied = lua.script(R"(return require("r4mw4tch").set_verbosity(3))");
  CHECK(applied == "debug");

  applied = lua.script(R"(return require("r4mw4tch").set_verbosity(0))").get<std::string>();
  CHECK(applied == "info");
}
