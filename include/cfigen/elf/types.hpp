#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <fmt/format.h>
#include <string_view>

namespace cfigen::elf {

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

enum elf_class : u8 { e32 = 1, e64 = 2 };
enum endianess : u8 { little = 1, big = 2 };
enum file_type : u16 { none_f, rel, exec, dyn, core };
enum machine_type : u16 { none_m, x86 = 3, avr = 0x53, x86_64 = 62 };

namespace sh {
enum type : u32 {
  null,
  prog_bit,
  sym_tab,
  str_tab,
  rela,
  hash,
  dynamic,
  note,
  nobit,
  rel,
};
} // namespace sh

namespace raw {

struct header {
  constexpr static std::array<u8, 4> default_magic = {0x7f, 'E', 'L', 'F'};
  std::array<u8, 4> magic;
  elf_class format;
  endianess endian;
  u8 ei_version;
  u8 abi;
  u8 abi_version;
  u8 padding[7];
  file_type type;
  machine_type machine;
  u32 e_version;
};

// u32 for ELFCLASS32, u64 for ELFCLASS64
template <std::unsigned_integral Int> struct header_body {
  Int entry_point;
  Int program_offset;
  Int section_offset;
};

struct header_tail {
  u32 flags;
  u16 header_size;
  u16 ph_size;
  u16 ph_num;
  u16 sh_size;
  u16 sh_num;
  u16 section_str_index;
};

template <std::unsigned_integral Int> struct section_header {
  u32 name_offset;
  sh::type type;
  Int flags;
  Int address;
  Int offset;
  Int size;
  u32 link;
  u32 info;
  Int alignment;
  Int entry_size;
};

static_assert(sizeof(header) == 24);
static_assert(sizeof(section_header<u32>) == 40);
static_assert(sizeof(section_header<u64>) == 64);

} // namespace raw

constexpr std::string_view to_string(machine_type m) noexcept {
  switch (m) {
  case none_m:
    return "none";
  case x86:
    return "x86";
  case avr:
    return "AVR";
  case x86_64:
    return "x86-64";
  }
  return "???";
}

constexpr std::string_view to_string(file_type t) noexcept {
  switch (t) {
  case none_f:
    return "none";
  case rel:
    return "relocatable";
  case exec:
    return "executable";
  case dyn:
    return "dynamic library";
  case core:
    return "core";
  }
  return "???";
}

} // namespace cfigen::elf

template <>
struct fmt::formatter<cfigen::elf::machine_type>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(cfigen::elf::machine_type m, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(cfigen::elf::to_string(m),
                                                    ctx);
  }
};

template <>
struct fmt::formatter<cfigen::elf::file_type>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(cfigen::elf::file_type t, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(cfigen::elf::to_string(t),
                                                    ctx);
  }
};
