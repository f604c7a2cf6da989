#include "cfigen/binary.hpp"
#include "cfigen/elf/elf.hpp"
#include "cfigen/error.hpp"
#include "cfigen/frame_table.hpp"
#include "cfigen/read_frame.hpp"
#include "cfigen/register_map.hpp"
#include <gtest/gtest.h>
#include <string_view>

using namespace cfigen;
namespace raw = cfigen::elf::raw;

namespace {

// A relocatable object with just a section name table and one payload
// section.
template <std::unsigned_integral Int>
std::vector<uint8_t> make_object(elf::elf_class format,
                                 std::string_view section_name,
                                 std::vector<uint8_t> const &payload) {
  std::string names = std::string("\0.shstrtab\0", 11) +
                      std::string(section_name) + std::string(1, '\0');

  std::vector<uint8_t> buffer;
  Writer w(buffer);
  auto header_size = sizeof(raw::header) + sizeof(raw::header_body<Int>) +
                     sizeof(raw::header_tail);
  auto names_offset = header_size;
  auto payload_offset = names_offset + names.size();
  auto sh_offset = payload_offset + payload.size();

  w.write(raw::header{.magic = raw::header::default_magic,
                      .format = format,
                      .endian = elf::little,
                      .ei_version = 1,
                      .abi = 0,
                      .abi_version = 0,
                      .padding = {},
                      .type = elf::rel,
                      .machine = elf::x86_64,
                      .e_version = 1});
  w.write(raw::header_body<Int>{.entry_point = 0,
                                .program_offset = 0,
                                .section_offset = Int(sh_offset)});
  w.write(raw::header_tail{.flags = 0,
                           .header_size = uint16_t(header_size),
                           .ph_size = 0,
                           .ph_num = 0,
                           .sh_size = sizeof(raw::section_header<Int>),
                           .sh_num = 3,
                           .section_str_index = 1});
  w.write_bytes(std::span(reinterpret_cast<const uint8_t *>(names.data()),
                          names.size()));
  w.write_bytes(payload);

  w.write(raw::section_header<Int>{});
  w.write(raw::section_header<Int>{.name_offset = 1,
                                   .type = elf::sh::str_tab,
                                   .flags = 0,
                                   .address = 0,
                                   .offset = Int(names_offset),
                                   .size = Int(names.size()),
                                   .link = 0,
                                   .info = 0,
                                   .alignment = 1,
                                   .entry_size = 0});
  w.write(raw::section_header<Int>{.name_offset = 11,
                                   .type = elf::sh::prog_bit,
                                   .flags = 0,
                                   .address = 0,
                                   .offset = Int(payload_offset),
                                   .size = Int(payload.size()),
                                   .link = 0,
                                   .info = 0,
                                   .alignment = 8,
                                   .entry_size = 0});
  return buffer;
}

std::vector<uint8_t> debug_frame() {
  register_map regs(x86_64_isa());
  auto table = header_entry::for_convention(
      frame_convention::for_target(x86_64_isa(), regs));
  table.functions.push_back(
      {.function_index = 0, .length = 12, .instructions = {cfi::advance_loc{1}}});
  return write_debug_frame(table).bytes;
}

} // namespace

TEST(ParseElf, FindsDebugFrame64) {
  auto bytes = debug_frame();
  auto file = elf::parse_buffer(make_object<uint64_t>(elf::e64, ".debug_frame", bytes));
  EXPECT_EQ(file.format, elf::e64);
  EXPECT_EQ(file.type, elf::rel);
  EXPECT_EQ(file.machine, elf::x86_64);
  EXPECT_EQ(file.address_size(), 8);
  ASSERT_EQ(file.sections.size(), 3u);
  EXPECT_EQ(file.sections[0].name, "");
  EXPECT_EQ(file.sections[1].name, ".shstrtab");

  auto &section = file.get_section(".debug_frame");
  EXPECT_EQ(section.type, elf::sh::prog_bit);
  EXPECT_EQ(section.alignment, 8u);
  EXPECT_EQ(section.data, bytes);

  auto frame = read_debug_frame(section.data, file.address_size());
  ASSERT_EQ(frame.fdes.size(), 1u);
  EXPECT_EQ(frame.fdes[0].address_range, 12u);
}

TEST(ParseElf, Elf32) {
  std::vector<uint8_t> payload = {1, 2, 3, 4};
  auto file = elf::parse_buffer(make_object<uint32_t>(elf::e32, ".data", payload));
  EXPECT_EQ(file.address_size(), 4);
  EXPECT_EQ(file.get_section(".data").data, payload);
  EXPECT_EQ(file.find_section(".debug_frame"), nullptr);
  EXPECT_THROW(file.get_section(".debug_frame"), read_error);
}

TEST(ParseElf, RejectsBadInput) {
  std::vector<uint8_t> not_elf(64, 0);
  EXPECT_THROW(elf::parse_buffer(not_elf), read_error);

  auto truncated = make_object<uint64_t>(elf::e64, ".debug_frame", debug_frame());
  truncated.resize(truncated.size() - 8);
  EXPECT_THROW(elf::parse_buffer(truncated), read_error);

  auto short_header = make_object<uint64_t>(elf::e64, ".text", {});
  short_header.resize(30);
  EXPECT_THROW(elf::parse_buffer(short_header), read_error);
}

TEST(ParseElf, SectionOutsideFile) {
  auto bytes = make_object<uint64_t>(elf::e64, ".text", {0x90});
  // point the last section header's size past the end of the file
  auto size_field = bytes.size() - sizeof(raw::section_header<uint64_t>) + 32;
  Writer w(bytes);
  w.patch(size_field, uint64_t{0x10000});
  EXPECT_THROW(elf::parse_buffer(bytes), read_error);
}
