#include "r4mw4tch/input/key_history.hpp"

#include "r4mw4tch/input/key_names.hpp"

namespace r4mw4tch {

key_history::key_history(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void key_history::push(std::string_view joined_keys) {
  if (joined_keys.empty() || joined_keys == no_keys_sentinel) {
    return;
  }

  entries_.emplace_back(joined_keys);
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

std::string key_history::last(size_t count) const {
  if (entries_.empty() || count == 0) {
    return no_keys_sentinel;
  }

  size_t take = count < entries_.size() ? count : entries_.size();
  std::string out;
  for (size_t i = entries_.size() - take; i < entries_.size(); ++i) {
    if (!out.empty()) {
      out += " | ";
    }
    out += entries_[i];
  }
  return out;
}

} // namespace r4mw4tch
