#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "r4mw4tch/core/trace_result.hpp"
#include "r4mw4tch/host/frame_host.hpp"
#include "r4mw4tch/region/memory_region.hpp"

namespace r4mtool {

struct recorded_frame {
  uint64_t frame = 0;
  std::filesystem::path dir;
};

/**
 * @brief lists `<root>/<frame>/` directories in frame order
 *
 * entries whose name is not a decimal frame number are ignored.
 */
r4mw4tch::trace_result<std::vector<recorded_frame>> discover_frames(const std::filesystem::path& root);

/**
 * @brief frame_host that serves recorded memory dumps
 *
 * a frame directory holds `<region>.bin` for every region (exactly the region
 * size), and optionally `keys.txt` ("A+Up"), `pc.txt` (hex) and `screen.png`,
 * which is copied to the requested path when a frame set completes.
 */
class replay_host : public r4mw4tch::frame_host {
public:
  explicit replay_host(std::vector<r4mw4tch::memory_region> regions);

  r4mw4tch::trace_status load(const std::filesystem::path& frame_dir);

  uint32_t read_u32_le(uint32_t address) override;
  void read_words(uint32_t address, std::span<uint32_t> out) override;
  std::optional<uint32_t> program_counter() override { return pc_; }
  std::optional<r4mw4tch::key_set> pressed_keys() override { return keys_; }
  bool capture_screenshot(const std::string& path) override;

private:
  struct region_image {
    r4mw4tch::memory_region region;
    std::vector<uint8_t> bytes;
  };

  const region_image& image_for(uint32_t address, uint32_t length) const;

  std::vector<region_image> images_;
  std::optional<uint32_t> pc_;
  std::optional<r4mw4tch::key_set> keys_;
  std::optional<std::filesystem::path> screen_;
  redlog::logger log_ = redlog::get_logger("r4mtool.replay_host");
};

} // namespace r4mtool
