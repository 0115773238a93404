#pragma once

#include <cstdint>

#include "r4mw4tch/region/memory_region.hpp"

namespace r4mw4tch {

// inclusive byte offsets of one chunk within its region
struct chunk_span {
  uint32_t start = 0;
  uint32_t end = 0;
  uint32_t index = 0;

  uint32_t length() const { return end - start + 1; }
};

/**
 * @brief word-aligned chunk size that splits `region_size` into at most `chunk_count` chunks
 *
 * ceil(size / chunks) rounded up to the word, so every region configured with the
 * same chunk count completes a full pass in the same number of chunks.
 */
uint32_t compute_chunk_size(uint32_t region_size, uint32_t chunk_count);

/**
 * @brief number of chunks a region of `region_size` needs at `chunk_size`
 */
uint32_t chunks_per_pass(uint32_t region_size, uint32_t chunk_size);

/**
 * @brief per-region scan position
 *
 * spreads a full-region pass across frames; each frame scans the span returned
 * by current() and then calls advance(), which reports the wrap that marks the
 * end of a full pass.
 */
class chunk_cursor {
public:
  chunk_cursor(const memory_region& region, uint32_t chunk_count);

  chunk_span current() const;

  // moves past the current chunk; returns true when the pass wrapped to offset 0
  bool advance();

  void reset();

  const memory_region& region() const { return region_; }
  uint32_t offset() const { return offset_; }
  uint32_t chunk_size() const { return chunk_size_; }
  uint32_t chunk_index() const { return chunk_index_; }
  uint32_t chunk_count() const { return chunk_count_; }
  uint64_t passes_completed() const { return passes_completed_; }

private:
  memory_region region_;
  uint32_t chunk_size_ = 0;
  uint32_t chunk_count_ = 0;
  uint32_t offset_ = 0;
  uint32_t chunk_index_ = 0;
  uint64_t passes_completed_ = 0;
};

} // namespace r4mw4tch
