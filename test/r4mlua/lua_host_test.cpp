#include <doctest/doctest.h>

#include <stdexcept>
#include <vector>

#include <sol/sol.hpp>

#include "r4mlua/lua_host.hpp"

using r4mw4tch::lua::lua_host;

namespace {

sol::table make_host(sol::state& lua, const char* source) {
  lua.open_libraries(sol::lib::base, sol::lib::table, sol::lib::string);
  sol::table host = lua.script(source);
  return host;
}

} // namespace

TEST_CASE("lua host forwards reads pc and keys") {
  sol::state lua;
  auto table = make_host(lua, R"(
    return {
      read_u32_le = function(addr) return addr - 0x03000000 end,
      pc = function() return 0x080001C4 end,
      keys = function() return { Up = true, A = true, B = false, Power = true } end,
      now_ms = function() return 1700000000123 end,
    }
  )");

  lua_host host(table);
  CHECK_FALSE(host.has_bulk_reads());
  CHECK(host.read_u32_le(0x03000010) == 0x10);
  CHECK(host.program_counter().value() == 0x080001C4);
  CHECK(host.pressed_keys().value().joined() == "A+Up");
  CHECK(host.timestamp_ms() == 1700000000123ull);

  std::vector<uint32_t> words(3);
  host.read_words(0x03000000, words);
  CHECK(words[2] == 8);
}

TEST_CASE("lua host decodes bulk byte reads") {
  sol::state lua;
  auto table = make_host(lua, R"(
    return {
      read_u32_le = function(addr) error("should not be called") end,
      read_bytes = function(addr, len)
        local out = {}
        for i = 0, len - 1 do out[i] = (i + 1) % 256 end
        return out
      end,
    }
  )");

  lua_host host(table);
  CHECK(host.has_bulk_reads());

  std::vector<uint32_t> words(2);
  host.read_words(0x02000000, words);
  CHECK(words[0] == 0x04030201);
  CHECK(words[1] == 0x08070605);
}

TEST_CASE("lua host reports missing capabilities as absent") {
  sol::state lua;
  auto table = make_host(lua, R"(
    return {
      read_u32_le = function(addr) return 0 end,
      pc = function() return nil end,
    }
  )");

  lua_host host(table);
  CHECK_FALSE(host.program_counter().has_value());
  CHECK_FALSE(host.pressed_keys().has_value());
  CHECK_FALSE(host.capture_screenshot("snapshots/0.png"));
}

TEST_CASE("lua host turns script errors into exceptions") {
  sol::state lua;
  auto table = make_host(lua, R"(
    return {
      read_u32_le = function(addr) error("bus error") end,
      screenshot = function(path) return false end,
    }
  )");

  lua_host host(table);
  CHECK_THROWS_AS(host.read_u32_le(0x03000000), std::runtime_error);
  CHECK_FALSE(host.capture_screenshot("snapshots/0.png"));

  sol::table empty = lua.create_table();
  CHECK_THROWS_AS(lua_host{empty}, std::invalid_argument);
}

TEST_CASE("lua host rejects numbers that do not fit a word") {
  sol::state lua;
  lua.open_libraries(sol::lib::math);
  auto table = make_host(lua, R"(
    values = { 0/0, 2^40, math.huge, -math.huge, 4294967296, -2147483649 }
    reads = 0
    return {
      read_u32_le = function(addr)
        reads = reads + 1
        return values[reads]
      end,
      pc = function() return 0/0 end,
      now_ms = function() return -1 end,
    }
  )");

  lua_host host(table);
  for (int i = 0; i < 6; ++i) {
    CHECK_THROWS_AS(host.read_u32_le(0x03000000), std::runtime_error);
  }
  CHECK_THROWS_AS(host.program_counter(), std::runtime_error);
  CHECK_THROWS_AS(host.timestamp_ms(), std::runtime_error);
}

TEST_CASE("lua host wraps signed and float reads into words") {
  sol::state lua;
  auto table = make_host(lua, R"(
    values = { -1, -2147483648, 4294967295, 16.75 }
    reads = 0
    return {
      read_u32_le = function(addr)
        reads = reads + 1
        return values[reads]
      end,
      now_ms = function() return 1700000000123.0 end,
    }
  )");

  lua_host host(table);
  CHECK(host.read_u32_le(0) == 0xFFFFFFFFu);
  CHECK(host.read_u32_le(0) == 0x80000000u);
  CHECK(host.read_u32_le(0) == 0xFFFFFFFFu);
  CHECK(host.read_u32_le(0) == 16u);
  CHECK(host.timestamp_ms() == 1700000000123ull);
}
