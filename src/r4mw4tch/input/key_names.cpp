#include "r4mw4tch/input/key_names.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "r4mbase/string_utils.hpp"

namespace r4mw4tch {

namespace {

constexpr std::array<std::pair<key_name, const char*>, key_name_count> key_table = {{
    {key_name::a, "A"},
    {key_name::b, "B"},
    {key_name::l, "L"},
    {key_name::r, "R"},
    {key_name::start, "Start"},
    {key_name::select, "Select"},
    {key_name::up, "Up"},
    {key_name::down, "Down"},
    {key_name::left, "Left"},
    {key_name::right, "Right"},
}};

} // namespace

const char* key_display_name(key_name key) {
  for (const auto& [value, name] : key_table) {
    if (value == key) {
      return name;
    }
  }
  return "?";
}

std::optional<key_name> key_from_name(std::string_view name) {
  std::string lower = util::to_lower(util::trim_view(name));
  for (const auto& [value, display] : key_table) {
    if (util::to_lower(display) == lower) {
      return value;
    }
  }
  return std::nullopt;
}

size_t key_set::size() const {
  size_t count = 0;
  for (const auto& entry : key_table) {
    if (contains(entry.first)) {
      count++;
    }
  }
  return count;
}

std::vector<key_name> key_set::keys() const {
  std::vector<key_name> out;
  for (const auto& entry : key_table) {
    if (contains(entry.first)) {
      out.push_back(entry.first);
    }
  }
  return out;
}

std::string key_set::joined() const {
  std::vector<std::string> names;
  for (const auto& [value, display] : key_table) {
    if (contains(value)) {
      names.emplace_back(display);
    }
  }
  std::sort(names.begin(), names.end());
  return util::join(names, "+");
}

key_set key_set::from_names(const std::vector<std::string>& names) {
  key_set out;
  for (const auto& name : names) {
    if (auto key = key_from_name(name)) {
      out.set(*key);
    }
  }
  return out;
}

key_set key_set::parse(std::string_view joined) {
  return from_names(util::split(joined, '+'));
}

} // namespace r4mw4tch
