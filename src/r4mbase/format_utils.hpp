#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace r4mw4tch::util {

inline std::string format_number(uint64_t value) {
  std::string out = std::to_string(value);
  for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(out.size()) - 3; i > 0; i -= 3) {
    out.insert(static_cast<size_t>(i), ",");
  }
  return out;
}

inline std::string format_hex(uint64_t value, size_t width = 0, bool prefix = true) {
  std::ostringstream out;
  if (prefix) {
    out << "0x";
  }
  out << std::hex;
  if (width > 0) {
    out << std::setw(static_cast<int>(width)) << std::setfill('0');
  }
  out << value;
  return out.str();
}

// eight uppercase digits, no prefix: the event log's word format
inline std::string format_hex8(uint32_t value) {
  static constexpr char digits[] = "0123456789ABCDEF";
  std::string out(8, '0');
  for (int i = 7; i >= 0; --i) {
    out[static_cast<size_t>(i)] = digits[value & 0xF];
    value >>= 4;
  }
  return out;
}

inline std::string format_address(uint64_t address) { return format_hex(address, 8, true); }

} // namespace r4mw4tch::util
