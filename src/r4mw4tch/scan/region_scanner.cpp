#include "r4mw4tch/scan/region_scanner.hpp"

#include <span>

namespace r4mw4tch {

region_scanner::region_scanner(const memory_region& region, uint32_t chunk_count)
    : cursor_(region, chunk_count), snapshot_(region), log_(redlog::get_logger("r4mw4tch.scanner." + region.name)) {
  words_.reserve(cursor_.chunk_size() / word_size + 1);
}

chunk_scan region_scanner::scan_current(frame_host& host, std::vector<word_change>& changes) {
  chunk_scan result;
  result.span = cursor_.current();

  const memory_region& mem = cursor_.region();
  if (mem.size == 0) {
    return result;
  }

  // word-aligned offsets inside [start, end]
  uint32_t first = (result.span.start + word_size - 1) / word_size * word_size;
  if (first > result.span.end) {
    return result;
  }
  uint32_t count = (result.span.end - first) / word_size + 1;

  words_.resize(count);
  host.read_words(mem.base_address + first, std::span<uint32_t>(words_.data(), words_.size()));

  for (uint32_t i = 0; i < count; ++i) {
    uint32_t address = mem.base_address + first + i * word_size;
    uint32_t current = words_[i];

    auto previous = snapshot_.exchange(address, current);
    if (previous && *previous != current) {
      changes.push_back(word_change{address, *previous, current});
      result.changes++;
    }
  }

  result.words_scanned = count;

  log_.ped(
      "scanned chunk", redlog::field("chunk", result.span.index), redlog::field("start", "0x%08x", result.span.start),
      redlog::field("end", "0x%08x", result.span.end), redlog::field("changes", result.changes)
  );
  return result;
}

} // namespace r4mw4tch
