#include "cfigen/binary.hpp"
#include "cfigen/cast.hpp"
#include "cfigen/elf/elf.hpp"
#include "cfigen/error.hpp"
#include "cfigen/macros.hpp"
#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace cfigen::elf {

namespace {

std::string_view string_at(std::span<const uint8_t> str_tab, u32 offset) {
  CFIGEN_THROW_IF(offset >= str_tab.size(), read_error,
                  "section name offset {:#x} outside of string table", offset);
  auto *start = reinterpret_cast<const char *>(str_tab.data() + offset);
  auto *nul = std::memchr(start, '\0', str_tab.size() - offset);
  CFIGEN_THROW_IF(!nul, read_error, "unterminated section name at {:#x}",
                  offset);
  return std::string_view(start, static_cast<const char *>(nul) - start);
}

template <std::unsigned_integral Int>
std::span<const uint8_t> contents(std::span<const uint8_t> buffer,
                                  raw::section_header<Int> const &sh) {
  if (sh.type == sh::nobit)
    return {};
  CFIGEN_THROW_IF(sh.offset > buffer.size() ||
                      sh.size > buffer.size() - sh.offset,
                  read_error, "section at {:#x} ({} bytes) runs past the end",
                  sh.offset, sh.size);
  return buffer.subspan(cast<size_t>(sh.offset), cast<size_t>(sh.size));
}

template <std::unsigned_integral Int>
file read_sections(std::span<const uint8_t> buffer, raw::header const &head,
                   Reader &data) {
  auto body = data.consume<raw::header_body<Int>>();
  auto tail = data.consume<raw::header_tail>();
  CFIGEN_THROW_IF(tail.sh_num != 0 &&
                      tail.sh_size != sizeof(raw::section_header<Int>),
                  read_error, "unexpected section header size {}",
                  tail.sh_size);

  file result{.format = head.format,
              .endian = head.endian,
              .type = head.type,
              .machine = head.machine,
              .entry_point = body.entry_point,
              .flags = tail.flags,
              .sections = {}};
  if (tail.sh_num == 0)
    return result;

  CFIGEN_THROW_IF(body.section_offset > buffer.size(), read_error,
                  "section header table at {:#x} is outside the file",
                  body.section_offset);
  auto table = Reader(buffer.subspan(cast<size_t>(body.section_offset)),
                      cast<size_t>(body.section_offset));
  std::vector<raw::section_header<Int>> headers;
  headers.reserve(tail.sh_num);
  for (u16 i = 0; i < tail.sh_num; i++) {
    headers.push_back(table.consume<raw::section_header<Int>>());
  }

  CFIGEN_THROW_IF(tail.section_str_index >= headers.size(), read_error,
                  "section name table index {} out of range",
                  tail.section_str_index);
  auto str_tab = contents(buffer, headers[tail.section_str_index]);

  result.sections.reserve(headers.size());
  for (auto &sh : headers) {
    auto bytes = contents(buffer, sh);
    result.sections.push_back(
        section{.name = std::string(string_at(str_tab, sh.name_offset)),
                .type = sh.type,
                .flags = sh.flags,
                .address = sh.address,
                .file_offset = sh.offset,
                .data = std::vector<uint8_t>(bytes.begin(), bytes.end()),
                .link = sh.link,
                .info = sh.info,
                .alignment = sh.alignment,
                .entry_size = sh.entry_size});
  }
  return result;
}

} // namespace

section const *file::find_section(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(
      sections, [&](section const &s) { return s.name == name; });
  return it == sections.end() ? nullptr : &*it;
}

section const &file::get_section(std::string_view name) const {
  if (auto *s = find_section(name))
    return *s;
  throw read_error(fmt::format("Section {} not found", name));
}

file parse_buffer(std::span<const uint8_t> buffer) {
  auto data = Reader(buffer);
  auto head = data.consume<raw::header>();
  CFIGEN_THROW_IF(head.magic != raw::header::default_magic, read_error,
                  "not an ELF file");
  CFIGEN_THROW_IF(head.endian != little, read_error,
                  "big-endian ELF files are not supported");

  switch (head.format) {
  case e32:
    return read_sections<u32>(buffer, head, data);
  case e64:
    return read_sections<u64>(buffer, head, data);
  }
  throw read_error(
      fmt::format("unknown ELF class {}", static_cast<int>(head.format)));
}

} // namespace cfigen::elf
