#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <redlog.hpp>

namespace r4mw4tch {

enum class sync_state {
  scanning,       // no region wrapped, or a set is still in progress
  set_complete,   // every region wrapped in the same invocation
  desynchronized, // some but not all regions wrapped
};

struct sync_outcome {
  sync_state state = sync_state::scanning;
  uint64_t frame_set_id = 0;   // set the frame belonged to
  std::string screenshot_path; // only for set_complete
};

/**
 * @brief groups frames into sets spanning one full pass over every region
 *
 * observe() is called once per traced frame with the number of regions whose
 * cursor wrapped. when all of them wrapped it returns set_complete carrying
 * the finishing set's id and screenshot path, then moves on to the next id.
 */
class frame_set_sync {
public:
  frame_set_sync(std::filesystem::path snapshot_dir, size_t region_count, uint64_t first_id = 0);

  sync_outcome observe(size_t regions_wrapped);

  std::string screenshot_path(uint64_t frame_set_id) const;

  uint64_t current_id() const { return current_id_; }
  uint64_t sets_completed() const { return sets_completed_; }
  uint64_t frames_in_set() const { return frames_in_set_; }

private:
  std::filesystem::path snapshot_dir_;
  size_t region_count_;
  uint64_t current_id_;
  uint64_t sets_completed_ = 0;
  uint64_t frames_in_set_ = 0;
  redlog::logger log_ = redlog::get_logger("r4mw4tch.frame_set");
};

} // namespace r4mw4tch
