#pragma once

#include "cfigen/elf/types.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cfigen::elf {

struct section {
  std::string name;
  sh::type type;
  u64 flags = 0;
  u64 address = 0;
  u64 file_offset = 0;
  std::vector<uint8_t> data;
  u32 link = 0;
  u32 info = 0;
  u64 alignment = 1;
  u64 entry_size = 0;
  bool operator==(section const &o) const noexcept = default;
};

struct file {
  elf_class format;
  endianess endian;
  file_type type;
  machine_type machine;
  u64 entry_point = 0;
  u32 flags = 0;
  std::vector<section> sections;

  u8 address_size() const noexcept { return format == e64 ? 8 : 4; }

  // nullptr when absent
  section const *find_section(std::string_view name) const noexcept;
  section const &get_section(std::string_view name) const;
};

// Little-endian ELF32/ELF64 only. Every offset and size is bounds-checked
// against the buffer.
file parse_buffer(std::span<const uint8_t> buffer);

} // namespace cfigen::elf
