#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace r4mw4tch {

constexpr uint32_t word_size = 4;

// a fixed window of emulated memory observed by the tracer
struct memory_region {
  std::string name;
  uint32_t base_address = 0;
  uint32_t size = 0;

  uint32_t end_address() const { return base_address + size; }
  bool contains(uint32_t address) const { return address >= base_address && address - base_address < size; }
  uint32_t word_count() const { return (size + word_size - 1) / word_size; }
};

namespace regions {

// gba internal work ram: 32 KiB on-chip
inline memory_region iwram() { return memory_region{"iwram", 0x03000000, 0x8000}; }

// gba external work ram: 256 KiB on the cartridge bus
inline memory_region ewram() { return memory_region{"ewram", 0x02000000, 0x40000}; }

// scan order is fixed: iwram first, then ewram
inline std::vector<memory_region> default_catalog() { return {iwram(), ewram()}; }

} // namespace regions

} // namespace r4mw4tch
