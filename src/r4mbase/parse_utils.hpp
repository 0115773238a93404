#pragma once

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "r4mbase/string_utils.hpp"

namespace r4mw4tch::util {

template <typename Enum>
bool parse_enum(std::string_view value, const std::initializer_list<std::pair<const char*, Enum>>& mapping, Enum& out) {
  std::string lower = to_lower(value);
  for (const auto& entry : mapping) {
    if (lower == to_lower(entry.first)) {
      out = entry.second;
      return true;
    }
  }
  return false;
}

// accepts decimal, 0x-prefixed hex, and bare hex when `assume_hex` is set
inline bool parse_u32(std::string_view text, uint32_t& out, bool assume_hex = false, std::string* error = nullptr) {
  std::string_view trimmed = trim_view(text);
  if (trimmed.empty()) {
    if (error) {
      *error = "empty value";
    }
    return false;
  }

  try {
    size_t consumed = 0;
    int base = assume_hex ? 16 : 0;
    unsigned long long value = std::stoull(std::string(trimmed), &consumed, base);
    if (consumed != trimmed.size()) {
      if (error) {
        *error = "trailing characters in '" + std::string(trimmed) + "'";
      }
      return false;
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
      if (error) {
        *error = "value out of range";
      }
      return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
  } catch (const std::exception& exc) {
    if (error) {
      *error = std::string("invalid number: ") + exc.what();
    }
    return false;
  }
}

inline bool parse_u64(std::string_view text, uint64_t& out, std::string* error = nullptr) {
  std::string_view trimmed = trim_view(text);
  if (trimmed.empty()) {
    if (error) {
      *error = "empty value";
    }
    return false;
  }

  try {
    size_t consumed = 0;
    unsigned long long value = std::stoull(std::string(trimmed), &consumed, 0);
    if (consumed != trimmed.size()) {
      if (error) {
        *error = "trailing characters in '" + std::string(trimmed) + "'";
      }
      return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
  } catch (const std::exception& exc) {
    if (error) {
      *error = std::string("invalid number: ") + exc.what();
    }
    return false;
  }
}

} // namespace r4mw4tch::util
