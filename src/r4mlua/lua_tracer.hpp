#pragma once

#include <deque>
#include <string>
#include <tuple>

#include <redlog.hpp>
#include <sol/sol.hpp>

#include "r4mlua/lua_host.hpp"
#include "r4mw4tch/tracer/change_tracer.hpp"
#include "r4mw4tch/tracer/tracer_config.hpp"

namespace r4mw4tch::lua {

constexpr size_t max_pending_diagnostics = 64;

// overlays lua option fields (log_path, chunks, window, ...) on `base`
tracer_config config_from_table(const sol::table& options, tracer_config base);

/**
 * @brief tracer object handed to lua scripts
 *
 * owns both the host adapter and the tracer so the host outlives every frame
 * the tracer scans. diagnostics are queued for the script to drain.
 */
class lua_tracer {
public:
  lua_tracer(sol::table host, tracer_config config);

  lua_tracer(const lua_tracer&) = delete;
  lua_tracer& operator=(const lua_tracer&) = delete;

  // true, or false plus the error message
  std::tuple<bool, std::string> start();
  void on_frame(uint64_t frame) { tracer_.on_frame(frame); }
  void on_shutdown() { tracer_.on_shutdown(); }
  bool flush() { return tracer_.flush().ok(); }

  sol::table stats(sol::this_state state) const;
  sol::table drain_diagnostics(sol::this_state state);

  const change_tracer& tracer() const { return tracer_; }

private:
  lua_host host_;
  change_tracer tracer_;
  std::deque<trace_diagnostic> pending_;
  redlog::logger log_ = redlog::get_logger("r4mw4tch.lua.tracer");
};

// builds the table returned by require("r4mw4tch")
sol::table open_module(sol::this_state state);

} // namespace r4mw4tch::lua
