#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>

namespace r4mw4tch {

constexpr uint64_t default_frequency_window = 100;

/**
 * @brief per-address change counts over a sliding window of frames
 *
 * record() appends the change frame and prunes entries at or before
 * `frame - window`, so the count covers the frames (frame - window, frame].
 * a lifetime total is kept beside the window for diagnostics.
 */
class frequency_window {
public:
  explicit frequency_window(uint64_t window_frames = default_frequency_window);

  // registers a change at `address` on `frame`; returns the windowed count including it
  uint32_t record(uint32_t address, uint64_t frame);

  uint32_t windowed_count(uint32_t address) const;
  uint64_t lifetime_count(uint32_t address) const;

  size_t tracked_addresses() const { return history_.size(); }
  uint64_t window_frames() const { return window_; }

  void clear() { history_.clear(); }

private:
  struct address_history {
    std::deque<uint64_t> frames;
    uint64_t lifetime = 0;
  };

  void prune(address_history& entry, uint64_t frame) const;

  uint64_t window_;
  std::unordered_map<uint32_t, address_history> history_;
};

} // namespace r4mw4tch
