#include "r4mlua/lua_tracer.hpp"

#include "r4mbase/cli/verbosity.hpp"

namespace r4mw4tch::lua {

tracer_config config_from_table(const sol::table& options, tracer_config base) {
  if (!options.valid()) {
    return base;
  }

  if (sol::optional<std::string> value = options["log_path"]) {
    base.log_path = *value;
  }
  if (sol::optional<std::string> value = options["snapshot_dir"]) {
    base.snapshot_dir = *value;
  }
  if (sol::optional<uint32_t> value = options["chunks"]) {
    base.chunk_count = *value;
  }
  if (sol::optional<uint64_t> value = options["window"]) {
    base.window_frames = *value;
  }
  if (sol::optional<size_t> value = options["flush_threshold"]) {
    base.flush_threshold = *value;
  }
  if (sol::optional<size_t> value = options["key_history"]) {
    base.key_history_capacity = *value;
  }
  if (sol::optional<size_t> value = options["last_keys"]) {
    base.last_keys_count = *value;
  }
  if (sol::optional<uint64_t> value = options["frame_skip"]) {
    base.frame_skip = *value;
  }
  if (sol::optional<uint64_t> value = options["safety_flush"]) {
    base.safety_flush_frames = *value;
  }
  if (sol::optional<bool> value = options["csv_header"]) {
    base.write_header = *value;
  }
  if (sol::optional<int> value = options["verbose"]) {
    base.verbose = *value;
  }

  return base;
}

lua_tracer::lua_tracer(sol::table host, tracer_config config)
    : host_(std::move(host)), tracer_(std::move(config), host_) {
  tracer_.set_diagnostic_sink([this](const trace_diagnostic& diagnostic) {
    pending_.push_back(diagnostic);
    while (pending_.size() > max_pending_diagnostics) {
      pending_.pop_front();
    }
  });
}

std::tuple<bool, std::string> lua_tracer::start() {
  trace_status status = tracer_.start();
  if (!status.ok()) {
    return {false, status.message};
  }
  return {true, std::string()};
}

sol::table lua_tracer::stats(sol::this_state state) const {
  sol::state_view lua(state);
  const tracer_stats& stats = tracer_.stats();

  sol::table out = lua.create_table();
  out["frames_seen"] = stats.frames_seen;
  out["frames_traced"] = stats.frames_traced;
  out["chunks_scanned"] = stats.chunks_scanned;
  out["words_scanned"] = stats.words_scanned;
  out["change_events"] = stats.change_events;
  out["frame_sets_completed"] = stats.frame_sets_completed;
  out["screenshots_failed"] = stats.screenshots_failed;
  out["frame_faults"] = stats.frame_faults;
  out["forced_flushes"] = stats.forced_flushes;
  out["io_failures"] = stats.io_failures;

  if (const tracer_state* current = tracer_.state()) {
    out["frame_set_id"] = current->frame_sets.current_id();
    out["buffered"] = current->log.buffered();
    out["lines_written"] = current->log.stats().lines_written;
  }
  return out;
}

sol::table lua_tracer::drain_diagnostics(sol::this_state state) {
  sol::state_view lua(state);
  sol::table out = lua.create_table(static_cast<int>(pending_.size()), 0);

  int index = 1;
  for (const auto& diagnostic : pending_) {
    sol::table entry = lua.create_table();
    entry["kind"] = diagnostic_kind_name(diagnostic.kind);
    entry["frame"] = diagnostic.frame;
    entry["message"] = diagnostic.message;
    out[index++] = entry;
  }
  pending_.clear();
  return out;
}

sol::table open_module(sol::this_state state) {
  sol::state_view lua(state);
  auto log = redlog::get_logger("r4mw4tch.lua");

  sol::table module = lua.create_table();

  module.new_usertype<lua_tracer>(
      "tracer", sol::no_constructor, "start", &lua_tracer::start, "on_frame", &lua_tracer::on_frame, "on_shutdown",
      &lua_tracer::on_shutdown, "flush", &lua_tracer::flush, "stats", &lua_tracer::stats, "diagnostics",
      &lua_tracer::drain_diagnostics
  );

  // r4mw4tch.new(host [, options]) -> tracer, already started
  module.set_function("new", [](sol::table host, sol::optional<sol::table> options) {
    tracer_config config = tracer_config::from_environment();
    if (options) {
      config = config_from_table(*options, config);
    }
    cli::apply_verbosity(config.verbose);

    auto tracer = std::make_unique<lua_tracer>(std::move(host), std::move(config));
    auto [ok, message] = tracer->start();
    if (!ok && !tracer->tracer().is_active()) {
      throw sol::error("r4mw4tch: tracer failed to start: " + message);
    }
    return tracer;
  });

  // r4mw4tch.set_verbosity(count) -> name of the log level now in effect
  module.set_function("set_verbosity", [](int level) { return std::string(cli::apply_verbosity(level)); });

  module["version"] = "0.1.0";

  log.dbg("lua module opened");
  return module;
}

} // namespace r4mw4tch::lua
