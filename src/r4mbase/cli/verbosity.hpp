#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include <redlog.hpp>

namespace r4mw4tch::cli {

// -v count to log level; counts past the end stay at the last entry
struct verbosity_step {
  redlog::level level;
  std::string_view name;
};

inline constexpr std::array<verbosity_step, 5> verbosity_steps{{
    {redlog::level::info, "info"},
    {redlog::level::verbose, "verbose"},
    {redlog::level::trace, "trace"},
    {redlog::level::debug, "debug"},
    {redlog::level::pedantic, "pedantic"},
}};

inline constexpr const verbosity_step& verbosity_for(int count) {
  if (count <= 0) {
    return verbosity_steps.front();
  }
  size_t index = static_cast<size_t>(count);
  return index < verbosity_steps.size() ? verbosity_steps[index] : verbosity_steps.back();
}

inline redlog::level level_from_verbosity(int count) { return verbosity_for(count).level; }

// sets the global redlog level and returns the name of the level chosen
inline std::string_view apply_verbosity(int count) {
  const verbosity_step& step = verbosity_for(count);
  redlog::set_level(step.level);
  return step.name;
}

} // namespace r4mw4tch::cli
