#include "r4mw4tch/scan/word_snapshot.hpp"

#include <algorithm>
#include <stdexcept>

#include "r4mbase/format_utils.hpp"

namespace r4mw4tch {

word_snapshot::word_snapshot(const memory_region& region)
    : region_(region), values_(region.word_count(), 0), observed_(region.word_count(), false) {}

size_t word_snapshot::slot_for(uint32_t address) const {
  if (!region_.contains(address)) {
    throw std::out_of_range("address " + util::format_address(address) + " outside region " + region_.name);
  }
  return (address - region_.base_address) / word_size;
}

std::optional<uint32_t> word_snapshot::exchange(uint32_t address, uint32_t value) {
  size_t slot = slot_for(address);

  uint32_t previous = values_[slot];
  values_[slot] = value;

  if (!observed_[slot]) {
    observed_[slot] = true;
    observed_count_++;
    return std::nullopt;
  }
  return previous;
}

std::optional<uint32_t> word_snapshot::get(uint32_t address) const {
  size_t slot = slot_for(address);
  if (!observed_[slot]) {
    return std::nullopt;
  }
  return values_[slot];
}

void word_snapshot::clear() {
  std::fill(values_.begin(), values_.end(), 0);
  std::fill(observed_.begin(), observed_.end(), false);
  observed_count_ = 0;
}

} // namespace r4mw4tch
