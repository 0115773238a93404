#pragma once

#include <cstdint>
#include <string>

namespace r4mw4tch {

// one detected word change, serialized into the event log as soon as it is built
struct change_event {
  uint64_t timestamp_ms = 0;
  std::string region;
  uint64_t frame = 0;
  uint32_t address = 0;
  uint32_t prev_val = 0;
  uint32_t curr_val = 0;
  uint32_t freq = 0;
  uint32_t pc = 0;
  std::string last_keys;
  std::string current_keys;
  uint64_t frame_set_id = 0;
  uint32_t chunk_id = 0;
};

} // namespace r4mw4tch
