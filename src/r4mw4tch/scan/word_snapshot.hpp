#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "r4mw4tch/region/memory_region.hpp"

namespace r4mw4tch {

/**
 * @brief last observed value of every word in a region
 *
 * storage is dense over the region's word slots; a slot counts as observed
 * once it has been written, so the first read of any word only seeds it.
 */
class word_snapshot {
public:
  explicit word_snapshot(const memory_region& region);

  // stores `value` and returns the value it replaces, nullopt on first observation
  std::optional<uint32_t> exchange(uint32_t address, uint32_t value);

  std::optional<uint32_t> get(uint32_t address) const;

  size_t observed_words() const { return observed_count_; }
  const memory_region& region() const { return region_; }

  void clear();

private:
  size_t slot_for(uint32_t address) const;

  memory_region region_;
  std::vector<uint32_t> values_;
  std::vector<bool> observed_;
  size_t observed_count_ = 0;
};

} // namespace r4mw4tch
