#include "r4mw4tch/stats/frequency_window.hpp"

namespace r4mw4tch {

frequency_window::frequency_window(uint64_t window_frames) : window_(window_frames == 0 ? 1 : window_frames) {}

void frequency_window::prune(address_history& entry, uint64_t frame) const {
  if (frame < window_) {
    return;
  }

  uint64_t cutoff = frame - window_;
  while (!entry.frames.empty() && entry.frames.front() <= cutoff) {
    entry.frames.pop_front();
  }
}

uint32_t frequency_window::record(uint32_t address, uint64_t frame) {
  address_history& entry = history_[address];

  // a host that rewinds (savestate load) restarts the timeline for this address
  if (!entry.frames.empty() && frame < entry.frames.back()) {
    entry.frames.clear();
  }

  entry.frames.push_back(frame);
  entry.lifetime++;
  prune(entry, frame);

  return static_cast<uint32_t>(entry.frames.size());
}

uint32_t frequency_window::windowed_count(uint32_t address) const {
  auto it = history_.find(address);
  if (it == history_.end()) {
    return 0;
  }
  return static_cast<uint32_t>(it->second.frames.size());
}

uint64_t frequency_window::lifetime_count(uint32_t address) const {
  auto it = history_.find(address);
  if (it == history_.end()) {
    return 0;
  }
  return it->second.lifetime;
}

} // namespace r4mw4tch
