#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include <redlog.hpp>
#include <sol/sol.hpp>

#include "r4mw4tch/host/frame_host.hpp"

namespace r4mw4tch::lua {

/**
 * @brief frame_host backed by functions from a lua table
 *
 * recognized fields, matching what a bizhawk style script has at hand:
 *   read_u32_le(address) -> integer            required
 *   read_bytes(address, length) -> table       optional bulk read (0- or 1-based)
 *   pc() -> integer|nil                        optional
 *   keys() -> { [name] = bool }                optional
 *   screenshot(path) -> bool|nil               optional, nil counts as written
 *   now_ms() -> integer                        optional
 *
 * lua errors are rethrown as std::runtime_error for the tracer to contain.
 */
class lua_host : public frame_host {
public:
  explicit lua_host(sol::table host);

  uint32_t read_u32_le(uint32_t address) override;
  void read_words(uint32_t address, std::span<uint32_t> out) override;
  std::optional<uint32_t> program_counter() override;
  std::optional<key_set> pressed_keys() override;
  bool capture_screenshot(const std::string& path) override;
  uint64_t timestamp_ms() override;

  bool has_bulk_reads() const { return read_bytes_.valid(); }

private:
  sol::protected_function read_u32_;
  sol::protected_function read_bytes_;
  sol::protected_function pc_;
  sol::protected_function keys_;
  sol::protected_function screenshot_;
  sol::protected_function now_ms_;
  redlog::logger log_ = redlog::get_logger("r4mw4tch.lua.host");
};

} // namespace r4mw4tch::lua
