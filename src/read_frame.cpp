#include "cfigen/binary.hpp"
#include "cfigen/cast.hpp"
#include "cfigen/dwarf.hpp"
#include "cfigen/error.hpp"
#include "cfigen/read_frame.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <optional>

namespace {
using namespace cfigen;
using namespace cfigen::dwarf;

// nullopt for padding
std::optional<call_frame_instruction> parse(Reader &r, int64_t data_alignment) {
  uint8_t inst = r.consume<uint8_t>();
  auto reg = [&] { return cast<dwarf_reg>(r.consume_uleb()); };
  auto factored = [&](int64_t value) {
    return cast<int32_t>(value * data_alignment);
  };

  switch (inst & primary_mask) {
  case DW_CFA_advance_loc:
    return cfi::advance_loc{uint32_t(inst & operand_mask)};
  case DW_CFA_offset: {
    dwarf_reg target = inst & operand_mask;
    return cfi::offset{target, cast<int32_t>(r.consume_uleb())};
  }
  case DW_CFA_restore:
    throw read_error(
        fmt::format("DW_CFA_restore at {:#x} is not supported", r.bytes_read));
  case 0:
    break;
  }

  switch (inst) {
  case DW_CFA_nop:
    return std::nullopt;
  case DW_CFA_advance_loc1:
    return cfi::advance_loc{r.consume<uint8_t>()};
  case DW_CFA_advance_loc2:
    return cfi::advance_loc{r.consume<uint16_t>()};
  case DW_CFA_advance_loc4:
    return cfi::advance_loc{r.consume<uint32_t>()};
  case DW_CFA_offset_extended: {
    auto target = reg();
    return cfi::offset{target, cast<int32_t>(r.consume_uleb())};
  }
  case DW_CFA_offset_extended_sf: {
    auto target = reg();
    return cfi::offset{target, cast<int32_t>(r.consume_sleb())};
  }
  case DW_CFA_def_cfa: {
    auto target = reg();
    return cfi::def_cfa{target, cast<int32_t>(r.consume_uleb())};
  }
  case DW_CFA_def_cfa_sf: {
    auto target = reg();
    return cfi::def_cfa{target, factored(r.consume_sleb())};
  }
  case DW_CFA_def_cfa_register:
    return cfi::def_cfa_register{reg()};
  case DW_CFA_def_cfa_offset:
    return cfi::def_cfa_offset{cast<int32_t>(r.consume_uleb())};
  case DW_CFA_def_cfa_offset_sf:
    return cfi::def_cfa_offset{factored(r.consume_sleb())};
  default:
    throw read_error(
        fmt::format("unexpected DW_CFA value: {:#04x}", inst));
  }
}

std::vector<call_frame_instruction> parse_all(Reader r,
                                              int64_t data_alignment) {
  std::vector<call_frame_instruction> result;
  while (!r.empty()) {
    if (auto inst = parse(r, data_alignment))
      result.push_back(*inst);
  }
  return result;
}

decoded_cie parse_cie(Reader data, uint64_t offset,
                      uint8_t default_address_size) {
  decoded_cie result{};
  result.offset = offset;
  result.version = data.consume<uint8_t>();
  if (result.version != 1 && result.version != 3 && result.version != 4) {
    throw read_error(fmt::format("CIE at {:#x} has unsupported version {}",
                                 offset, result.version));
  }

  result.augmentation = data.consume_cstr();
  if (!result.augmentation.empty()) {
    throw read_error(fmt::format("CIE at {:#x} has augmentation \"{}\"",
                                 offset, result.augmentation));
  }
  result.address_size = default_address_size;
  if (result.version >= 4) {
    result.address_size = data.consume<uint8_t>();
    result.segment_size = data.consume<uint8_t>();
  }
  result.code_alignment = data.consume_uleb();
  result.data_alignment = data.consume_sleb();
  if (result.version == 1) {
    result.return_address = data.consume<uint8_t>();
  } else {
    result.return_address = data.consume_uleb();
  }
  result.instructions = parse_all(data, result.data_alignment);
  return result;
}

uint64_t consume_address(Reader &r, uint8_t size) {
  switch (size) {
  case 4:
    return r.consume<uint32_t>();
  case 8:
    return r.consume<uint64_t>();
  default:
    throw read_error(fmt::format("unsupported address size {}", size));
  }
}

decoded_fde parse_fde(Reader data, uint64_t offset, uint64_t cie_offset,
                      decoded_cie const &cie) {
  decoded_fde result{};
  result.offset = offset;
  result.cie_offset = cie_offset;
  result.initial_address = consume_address(data, cie.address_size);
  result.address_range = consume_address(data, cie.address_size);
  result.instructions = parse_all(data, cie.data_alignment);
  return result;
}

} // namespace

namespace cfigen {

std::vector<call_frame_instruction>
parse_instructions(std::span<const uint8_t> data, int64_t data_alignment) {
  return parse_all(Reader(data), data_alignment);
}

decoded_frame read_debug_frame(std::span<const uint8_t> section,
                               uint8_t default_address_size) {
  decoded_frame result;
  auto data = Reader(section);
  while (!data.empty()) {
    auto pos = data.bytes_read;
    uint64_t length = data.consume<uint32_t>();
    if (length == 0xffff'ffff) {
      throw read_error(
          fmt::format("64-bit DWARF entry at {:#x} is not supported", pos));
    }
    if (length < sizeof(uint32_t)) {
      throw read_error(fmt::format("entry at {:#x} is too short", pos));
    }

    auto body = data.subspan(length);
    auto id = body.consume<uint32_t>();
    if (id == cie_id) {
      result.cies.push_back(parse_cie(body, pos, default_address_size));
    } else {
      auto cie = std::ranges::find(result.cies, uint64_t{id},
                                   &decoded_cie::offset);
      if (cie == result.cies.end()) {
        throw read_error(fmt::format(
            "FDE at {:#x} refers to unknown CIE at {:#x}", pos, id));
      }
      result.fdes.push_back(parse_fde(body, pos, id, *cie));
    }
    data.increment(length);
  }
  return result;
}

} // namespace cfigen
