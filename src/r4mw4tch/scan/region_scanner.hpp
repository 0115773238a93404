#pragma once

#include <cstdint>
#include <vector>

#include <redlog.hpp>

#include "r4mw4tch/host/frame_host.hpp"
#include "r4mw4tch/region/memory_region.hpp"
#include "r4mw4tch/scan/chunk_cursor.hpp"
#include "r4mw4tch/scan/word_snapshot.hpp"

namespace r4mw4tch {

struct word_change {
  uint32_t address = 0;
  uint32_t previous = 0;
  uint32_t current = 0;
};

struct chunk_scan {
  chunk_span span{};
  uint32_t words_scanned = 0;
  uint32_t changes = 0;
};

/**
 * @brief diff engine for one region
 *
 * scan_current() reads the cursor's current chunk from the host, compares each
 * word against the snapshot and appends the differing ones to `changes`. the
 * cursor is left in place so the caller can advance every region together
 * once all of them have been scanned.
 */
class region_scanner {
public:
  region_scanner(const memory_region& region, uint32_t chunk_count);

  chunk_scan scan_current(frame_host& host, std::vector<word_change>& changes);

  // see chunk_cursor::advance
  bool advance() { return cursor_.advance(); }

  const memory_region& region() const { return cursor_.region(); }
  const chunk_cursor& cursor() const { return cursor_; }
  const word_snapshot& snapshot() const { return snapshot_; }

private:
  chunk_cursor cursor_;
  word_snapshot snapshot_;
  std::vector<uint32_t> words_;
  redlog::logger log_;
};

} // namespace r4mw4tch
