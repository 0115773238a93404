#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "r4mbase/time_utils.hpp"
#include "r4mw4tch/input/key_names.hpp"

namespace r4mw4tch {

/**
 * @brief read-only view of the emulated machine, supplied by the embedding host
 *
 * the tracer calls into the host only from inside on_frame(). any member may
 * throw to report a host failure; the tracer contains it at the frame boundary.
 */
class frame_host {
public:
  virtual ~frame_host() = default;

  // 32-bit little-endian word at an absolute address
  virtual uint32_t read_u32_le(uint32_t address) = 0;

  // consecutive words starting at `address`; hosts with bulk access should override
  virtual void read_words(uint32_t address, std::span<uint32_t> out) {
    for (size_t i = 0; i < out.size(); ++i) {
      out[i] = read_u32_le(address + static_cast<uint32_t>(i * 4));
    }
  }

  // program counter, nullopt when the host cannot provide one
  virtual std::optional<uint32_t> program_counter() = 0;

  // held buttons, nullopt when input state is unavailable
  virtual std::optional<key_set> pressed_keys() = 0;

  // writes an image of the current frame to `path`; false when nothing was written
  virtual bool capture_screenshot(const std::string& path) = 0;

  virtual uint64_t timestamp_ms() { return util::now_epoch_ms(); }
};

} // namespace r4mw4tch
