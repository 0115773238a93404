#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace r4mw4tch {

constexpr size_t default_key_history_capacity = 20;
constexpr size_t default_last_keys_count = 5;

/**
 * @brief bounded record of recent non-empty key combinations
 *
 * the oldest entry is evicted once `capacity` is reached. summaries are joined
 * oldest to newest with " | ".
 */
class key_history {
public:
  explicit key_history(size_t capacity = default_key_history_capacity);

  // ignores empty strings and the "None" sentinel
  void push(std::string_view joined_keys);

  // most recent `count` entries, oldest first; "None" when the history is empty
  std::string last(size_t count = default_last_keys_count) const;

  std::vector<std::string> entries() const { return {entries_.begin(), entries_.end()}; }
  size_t size() const { return entries_.size(); }
  size_t capacity() const { return capacity_; }

  void clear() { entries_.clear(); }

private:
  size_t capacity_;
  std::deque<std::string> entries_;
};

} // namespace r4mw4tch
