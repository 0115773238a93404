#include "r4mw4tch/sync/frame_set_sync.hpp"

namespace r4mw4tch {

frame_set_sync::frame_set_sync(std::filesystem::path snapshot_dir, size_t region_count, uint64_t first_id)
    : snapshot_dir_(std::move(snapshot_dir)), region_count_(region_count), current_id_(first_id) {}

std::string frame_set_sync::screenshot_path(uint64_t frame_set_id) const {
  return (snapshot_dir_ / (std::to_string(frame_set_id) + ".png")).string();
}

sync_outcome frame_set_sync::observe(size_t regions_wrapped) {
  sync_outcome outcome;
  outcome.frame_set_id = current_id_;
  frames_in_set_++;

  if (regions_wrapped == 0 || region_count_ == 0) {
    return outcome;
  }

  if (regions_wrapped < region_count_) {
    log_.wrn(
        "regions wrapped out of step", redlog::field("frame_set_id", current_id_),
        redlog::field("wrapped", regions_wrapped), redlog::field("regions", region_count_)
    );
    outcome.state = sync_state::desynchronized;
    return outcome;
  }

  outcome.state = sync_state::set_complete;
  outcome.screenshot_path = screenshot_path(current_id_);

  log_.vrb(
      "frame set complete", redlog::field("frame_set_id", current_id_), redlog::field("frames", frames_in_set_)
  );

  current_id_++;
  sets_completed_++;
  frames_in_set_ = 0;
  return outcome;
}

} // namespace r4mw4tch
