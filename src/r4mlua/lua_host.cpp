#include "r4mlua/lua_host.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace r4mw4tch::lua {

namespace {

sol::protected_function optional_function(const sol::table& host, const char* name) {
  sol::object value = host[name];
  if (value.get_type() != sol::type::function) {
    return sol::protected_function();
  }
  return value.as<sol::protected_function>();
}

// read as double: sol converts floats to integers without a range check.
// every value a u32 or u64 ms clock can take below 2^53 survives exactly.
double to_finite(const sol::object& value, const char* what) {
  if (value.get_type() != sol::type::number) {
    throw std::runtime_error(std::string(what) + " returned a non-number");
  }
  double number = value.as<double>();
  if (!std::isfinite(number)) {
    throw std::runtime_error(std::string(what) + " returned a non-finite number");
  }
  return std::trunc(number);
}

// lua numbers may arrive as floats or negative integers from signed reads
uint32_t to_u32(const sol::object& value, const char* what) {
  double number = to_finite(value, what);
  if (number < -2147483648.0 || number >= 4294967296.0) {
    throw std::runtime_error(std::string(what) + " returned a value outside 32 bits");
  }
  if (number < 0) {
    return static_cast<uint32_t>(static_cast<int32_t>(number));
  }
  return static_cast<uint32_t>(number);
}

template <typename... Args>
sol::protected_function_result checked_call(const sol::protected_function& fn, const char* name, Args&&... args) {
  sol::protected_function_result result = fn(std::forward<Args>(args)...);
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("host.") + name + " failed: " + err.what());
  }
  return result;
}

} // namespace

lua_host::lua_host(sol::table host)
    : read_u32_(optional_function(host, "read_u32_le")), read_bytes_(optional_function(host, "read_bytes")),
      pc_(optional_function(host, "pc")), keys_(optional_function(host, "keys")),
      screenshot_(optional_function(host, "screenshot")), now_ms_(optional_function(host, "now_ms")) {
  if (!read_u32_.valid()) {
    throw std::invalid_argument("host table needs a read_u32_le function");
  }

  log_.dbg(
      "lua host bound", redlog::field("bulk_reads", read_bytes_.valid()), redlog::field("pc", pc_.valid()),
      redlog::field("keys", keys_.valid()), redlog::field("screenshot", screenshot_.valid())
  );
}

uint32_t lua_host::read_u32_le(uint32_t address) {
  auto result = checked_call(read_u32_, "read_u32_le", address);
  return to_u32(result.get<sol::object>(), "host.read_u32_le");
}

void lua_host::read_words(uint32_t address, std::span<uint32_t> out) {
  if (!read_bytes_.valid()) {
    frame_host::read_words(address, out);
    return;
  }

  size_t length = out.size() * 4;
  auto result = checked_call(read_bytes_, "read_bytes", address, length);
  sol::object value = result.get<sol::object>();
  if (value.get_type() != sol::type::table) {
    throw std::runtime_error("host.read_bytes returned a non-table");
  }

  sol::table bytes = value.as<sol::table>();
  // bizhawk's readbyterange is 0-based, plain lua arrays are 1-based
  size_t first = bytes.get<sol::optional<int64_t>>(0) ? 0 : 1;

  for (size_t i = 0; i < out.size(); ++i) {
    uint32_t word = 0;
    for (size_t b = 0; b < 4; ++b) {
      auto byte = bytes.get<sol::optional<int64_t>>(first + i * 4 + b);
      if (!byte) {
        throw std::runtime_error("host.read_bytes returned fewer bytes than requested");
      }
      word |= (static_cast<uint32_t>(*byte) & 0xFFu) << (8 * b);
    }
    out[i] = word;
  }
}

std::optional<uint32_t> lua_host::program_counter() {
  if (!pc_.valid()) {
    return std::nullopt;
  }

  auto result = checked_call(pc_, "pc");
  sol::object value = result.get<sol::object>();
  if (value.get_type() != sol::type::number) {
    return std::nullopt;
  }
  return to_u32(value, "host.pc");
}

std::optional<key_set> lua_host::pressed_keys() {
  if (!keys_.valid()) {
    return std::nullopt;
  }

  auto result = checked_call(keys_, "keys");
  sol::object value = result.get<sol::object>();
  if (value.get_type() != sol::type::table) {
    return std::nullopt;
  }

  key_set keys;
  for (const auto& [name, pressed] : value.as<sol::table>()) {
    if (name.get_type() != sol::type::string || !pressed.is<bool>() || !pressed.as<bool>()) {
      continue;
    }
    if (auto key = key_from_name(name.as<std::string>())) {
      keys.set(*key);
    }
  }
  return keys;
}

bool lua_host::capture_screenshot(const std::string& path) {
  if (!screenshot_.valid()) {
    return false;
  }

  auto result = checked_call(screenshot_, "screenshot", path);
  sol::object value = result.get<sol::object>();
  if (value.get_type() == sol::type::boolean) {
    return value.as<bool>();
  }
  return true;
}

uint64_t lua_host::timestamp_ms() {
  if (!now_ms_.valid()) {
    return frame_host::timestamp_ms();
  }

  auto result = checked_call(now_ms_, "now_ms");
  sol::object value = result.get<sol::object>();
  if (value.get_type() != sol::type::number) {
    return frame_host::timestamp_ms();
  }
  double number = to_finite(value, "host.now_ms");
  // 2^64
  if (number < 0 || number >= 18446744073709551616.0) {
    throw std::runtime_error("host.now_ms returned a value outside the millisecond clock range");
  }
  return static_cast<uint64_t>(number);
}

} // namespace r4mw4tch::lua
