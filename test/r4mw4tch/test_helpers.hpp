#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

#include "r4mw4tch/host/frame_host.hpp"

namespace r4mw4tch::test {

// sparse memory; unset words read as zero
class fake_host : public frame_host {
public:
  uint32_t read_u32_le(uint32_t address) override {
    reads++;
    if (fail_reads) {
      throw std::runtime_error("memory read failed");
    }
    auto it = memory.find(address);
    return it == memory.end() ? 0 : it->second;
  }

  std::optional<uint32_t> program_counter() override { return pc; }
  std::optional<key_set> pressed_keys() override { return keys; }

  bool capture_screenshot(const std::string& path) override {
    screenshots.push_back(path);
    if (!screenshot_succeeds) {
      return false;
    }
    std::ofstream out(path, std::ios::out | std::ios::binary);
    out << "png";
    return static_cast<bool>(out);
  }

  uint64_t timestamp_ms() override { return clock_ms; }

  std::map<uint32_t, uint32_t> memory;
  std::optional<uint32_t> pc = 0x08000000;
  std::optional<key_set> keys = key_set{};
  std::vector<std::string> screenshots;
  uint64_t clock_ms = 1700000000000;
  uint64_t reads = 0;
  bool fail_reads = false;
  bool screenshot_succeeds = true;
};

// unique scratch directory removed on destruction
class temp_dir {
public:
  explicit temp_dir(const std::string& tag) {
#if defined(_WIN32)
    int pid = _getpid();
#else
    int pid = getpid();
#endif
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("r4mw4tch_" + tag + "_" + std::to_string(pid) + "_" + std::to_string(static_cast<long long>(now)));
    std::filesystem::create_directories(path_);
  }

  ~temp_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::in | std::ios::binary);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    lines.push_back(line);
  }
  return lines;
}

} // namespace r4mw4tch::test
