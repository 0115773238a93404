#include "r4mw4tch/scan/chunk_cursor.hpp"

#include <algorithm>

namespace r4mw4tch {

uint32_t compute_chunk_size(uint32_t region_size, uint32_t chunk_count) {
  if (region_size == 0) {
    return word_size;
  }
  if (chunk_count == 0) {
    chunk_count = 1;
  }

  uint64_t size = (static_cast<uint64_t>(region_size) + chunk_count - 1) / chunk_count;
  size = (size + word_size - 1) / word_size * word_size;
  return static_cast<uint32_t>(std::max<uint64_t>(size, word_size));
}

uint32_t chunks_per_pass(uint32_t region_size, uint32_t chunk_size) {
  if (chunk_size == 0) {
    return 0;
  }
  return static_cast<uint32_t>((static_cast<uint64_t>(region_size) + chunk_size - 1) / chunk_size);
}

chunk_cursor::chunk_cursor(const memory_region& region, uint32_t chunk_count)
    : region_(region), chunk_size_(compute_chunk_size(region.size, chunk_count)) {
  chunk_count_ = chunks_per_pass(region_.size, chunk_size_);
}

chunk_span chunk_cursor::current() const {
  chunk_span span;
  span.start = offset_;
  span.index = chunk_index_;

  if (region_.size == 0) {
    span.end = 0;
    return span;
  }

  uint64_t end = static_cast<uint64_t>(offset_) + chunk_size_ - 1;
  span.end = static_cast<uint32_t>(std::min<uint64_t>(end, region_.size - 1));
  return span;
}

bool chunk_cursor::advance() {
  chunk_span span = current();
  uint64_t next = static_cast<uint64_t>(span.end) + 1;

  if (next >= region_.size) {
    offset_ = 0;
    chunk_index_ = 0;
    passes_completed_++;
    return true;
  }

  offset_ = static_cast<uint32_t>(next);
  chunk_index_++;
  return false;
}

void chunk_cursor::reset() {
  offset_ = 0;
  chunk_index_ = 0;
  passes_completed_ = 0;
}

} // namespace r4mw4tch
