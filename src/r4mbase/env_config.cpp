#include "r4mbase/env_config.hpp"

#include <cstdlib>
#include <exception>
#include <sstream>

namespace r4mw4tch::util {

env_config::env_config(std::string prefix) : prefix_(std::move(prefix)) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? trim_copy(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }

  log_.wrn(
      "failed to parse as bool, using default", redlog::field("name", build_env_name(name)),
      redlog::field("value", value)
  );
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    log_.wrn(
        "failed to parse as int, using default", redlog::field("name", build_env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }
}

template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return static_cast<uint32_t>(std::stoul(value, nullptr, 0));
  } catch (const std::exception& e) {
    log_.wrn(
        "failed to parse as uint32_t, using default", redlog::field("name", build_env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }
}

template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoull(value, nullptr, 0);
  } catch (const std::exception& e) {
    log_.wrn(
        "failed to parse as uint64_t, using default", redlog::field("name", build_env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  std::string value = get_env_value(name);
  std::vector<std::string> result;

  if (value.empty()) {
    return result;
  }

  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, delimiter)) {
    std::string trimmed = trim_copy(item);
    if (!trimmed.empty()) {
      result.push_back(std::move(trimmed));
    }
  }

  return result;
}

} // namespace r4mw4tch::util
