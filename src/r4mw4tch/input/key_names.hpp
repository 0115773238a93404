#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace r4mw4tch {

// buttons the tracer records; anything else the host reports is ignored
enum class key_name : uint8_t { a, b, l, r, start, select, up, down, left, right };

constexpr size_t key_name_count = 10;

// sentinel written wherever no key is held or no history exists
constexpr const char* no_keys_sentinel = "None";

const char* key_display_name(key_name key);

// case-insensitive lookup against the allow-list
std::optional<key_name> key_from_name(std::string_view name);

class key_set {
public:
  key_set() = default;

  void set(key_name key) { bits_ |= bit(key); }
  void clear(key_name key) { bits_ &= static_cast<uint16_t>(~bit(key)); }
  bool contains(key_name key) const { return (bits_ & bit(key)) != 0; }
  bool empty() const { return bits_ == 0; }
  size_t size() const;

  // display names sorted by byte order and joined with '+', e.g. "A+Up"; empty when no key is held
  std::string joined() const;

  std::vector<key_name> keys() const;

  static key_set from_names(const std::vector<std::string>& names);

  // parses "A+Up"; unknown names and the "None" sentinel are dropped
  static key_set parse(std::string_view joined);

  bool operator==(const key_set& other) const { return bits_ == other.bits_; }
  bool operator!=(const key_set& other) const { return bits_ != other.bits_; }

private:
  static uint16_t bit(key_name key) { return static_cast<uint16_t>(1u << static_cast<unsigned>(key)); }

  uint16_t bits_ = 0;
};

} // namespace r4mw4tch
