#include "replay_host.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include "r4mbase/format_utils.hpp"
#include "r4mbase/parse_utils.hpp"
#include "r4mbase/string_utils.hpp"

namespace r4mtool {

namespace fs = std::filesystem;
using r4mw4tch::error_code;

namespace {

std::optional<std::string> read_text(const fs::path& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return std::nullopt;
  }
  std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  return r4mw4tch::util::trim_copy(text);
}

} // namespace

r4mw4tch::trace_result<std::vector<recorded_frame>> discover_frames(const fs::path& root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return r4mw4tch::error_result<std::vector<recorded_frame>>(
        error_code::invalid_argument, root.string() + " is not a directory"
    );
  }

  std::vector<recorded_frame> frames;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_directory()) {
      continue;
    }

    std::string name = it->path().filename().string();
    if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
      continue;
    }

    uint64_t frame = 0;
    if (!r4mw4tch::util::parse_u64(name, frame)) {
      continue;
    }
    frames.push_back(recorded_frame{frame, it->path()});
  }

  if (ec) {
    return r4mw4tch::error_result<std::vector<recorded_frame>>(
        error_code::io_error, "cannot list " + root.string() + ": " + ec.message()
    );
  }

  std::sort(frames.begin(), frames.end(), [](const recorded_frame& a, const recorded_frame& b) {
    return a.frame < b.frame;
  });
  return r4mw4tch::ok_result(std::move(frames));
}

replay_host::replay_host(std::vector<r4mw4tch::memory_region> regions) {
  images_.reserve(regions.size());
  for (auto& region : regions) {
    images_.push_back(region_image{std::move(region), {}});
  }
}

r4mw4tch::trace_status replay_host::load(const fs::path& frame_dir) {
  for (auto& image : images_) {
    fs::path path = frame_dir / (image.region.name + ".bin");
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
      return r4mw4tch::make_status(error_code::io_error, "missing dump " + path.string());
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (bytes.size() != image.region.size) {
      return r4mw4tch::make_status(
          error_code::invalid_argument, path.string() + " holds " + std::to_string(bytes.size()) + " bytes, expected " +
                                            std::to_string(image.region.size)
      );
    }
    image.bytes = std::move(bytes);
  }

  keys_.reset();
  if (auto text = read_text(frame_dir / "keys.txt")) {
    keys_ = r4mw4tch::key_set::parse(*text);
  }

  pc_.reset();
  if (auto text = read_text(frame_dir / "pc.txt")) {
    uint32_t value = 0;
    std::string error;
    if (r4mw4tch::util::parse_u32(*text, value, true, &error)) {
      pc_ = value;
    } else {
      log_.wrn("ignoring unreadable pc", redlog::field("dir", frame_dir.string()), redlog::field("error", error));
    }
  }

  std::error_code ec;
  fs::path screen = frame_dir / "screen.png";
  screen_ = fs::exists(screen, ec) ? std::optional<fs::path>(screen) : std::nullopt;

  log_.ped("loaded frame", redlog::field("dir", frame_dir.string()));
  return r4mw4tch::ok_status();
}

const replay_host::region_image& replay_host::image_for(uint32_t address, uint32_t length) const {
  for (const auto& image : images_) {
    const auto& region = image.region;
    if (region.contains(address) && address - region.base_address + length <= image.bytes.size()) {
      return image;
    }
  }
  throw std::out_of_range("no recorded memory at " + r4mw4tch::util::format_address(address));
}

uint32_t replay_host::read_u32_le(uint32_t address) {
  const region_image& image = image_for(address, 4);
  size_t offset = address - image.region.base_address;
  return static_cast<uint32_t>(image.bytes[offset]) | (static_cast<uint32_t>(image.bytes[offset + 1]) << 8) |
         (static_cast<uint32_t>(image.bytes[offset + 2]) << 16) |
         (static_cast<uint32_t>(image.bytes[offset + 3]) << 24);
}

void replay_host::read_words(uint32_t address, std::span<uint32_t> out) {
  const region_image& image = image_for(address, static_cast<uint32_t>(out.size() * 4));
  size_t offset = address - image.region.base_address;
  for (size_t i = 0; i < out.size(); ++i) {
    const uint8_t* word = image.bytes.data() + offset + i * 4;
    out[i] = static_cast<uint32_t>(word[0]) | (static_cast<uint32_t>(word[1]) << 8) |
             (static_cast<uint32_t>(word[2]) << 16) | (static_cast<uint32_t>(word[3]) << 24);
  }
}

bool replay_host::capture_screenshot(const std::string& path) {
  if (!screen_) {
    return false;
  }

  std::error_code ec;
  fs::copy_file(*screen_, path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    log_.wrn("failed to copy screenshot", redlog::field("to", path), redlog::field("error", ec.message()));
    return false;
  }
  return true;
}

} // namespace r4mtool
