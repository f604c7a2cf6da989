#include "cfigen/binary.hpp"
#include "cfigen/cast.hpp"
#include "cfigen/dwarf.hpp"
#include "cfigen/error.hpp"
#include "cfigen/frame_table.hpp"
#include "cfigen/macros.hpp"
#include "cfigen/overloaded.hpp"
#include <cstddef>
#include <cstdint>
#include <fmt/core.h>
#include <string_view>

namespace {
using namespace cfigen;
using namespace cfigen::dwarf;

int64_t factor(int32_t offset, int8_t data_alignment, std::string_view what) {
  CFIGEN_THROW_IF(offset % data_alignment != 0, precondition_error,
                  "{} {} is not a multiple of the data alignment {}", what,
                  offset, data_alignment);
  return offset / data_alignment;
}

void write_address(Writer &w, uint64_t value, uint8_t size) {
  switch (size) {
  case 4:
    w.write(cast<uint32_t>(value));
    return;
  case 8:
    w.write(value);
    return;
  default:
    throw precondition_error(
        fmt::format("unsupported address size {}", size));
  }
}

// Reserves the length prefix and returns where the entry starts.
size_t begin_entry(Writer &w) {
  auto start = w.bytes_written();
  w.write(uint32_t{0});
  return start;
}

void end_entry(Writer &w, size_t start, uint8_t address_size) {
  while ((w.bytes_written() - start) % address_size != 0)
    w.write(uint8_t{DW_CFA_nop});
  w.patch(start,
          cast<uint32_t>(w.bytes_written() - start - sizeof(uint32_t)));
}
} // namespace

namespace cfigen {

void write_instruction(Writer &w, call_frame_instruction const &inst,
                       int8_t data_alignment) {
  std::visit(
      overloaded{
          [&](cfi::advance_loc const &a) {
            // deltas are measured from the previous frame change, so a
            // large one means the extractor lost track
            CFIGEN_THROW_IF(a.delta > operand_mask, precondition_error,
                            "advance_loc delta {} does not fit in 6 bits",
                            a.delta);
            w.write(uint8_t(DW_CFA_advance_loc | a.delta));
          },
          [&](cfi::def_cfa const &d) {
            if (d.offset >= 0) {
              w.write(uint8_t{DW_CFA_def_cfa});
              w.write_uleb(d.reg);
              w.write_uleb(d.offset);
            } else {
              w.write(uint8_t{DW_CFA_def_cfa_sf});
              w.write_uleb(d.reg);
              w.write_sleb(factor(d.offset, data_alignment, "CFA offset"));
            }
          },
          [&](cfi::def_cfa_register const &d) {
            w.write(uint8_t{DW_CFA_def_cfa_register});
            w.write_uleb(d.reg);
          },
          [&](cfi::def_cfa_offset const &d) {
            if (d.offset >= 0) {
              w.write(uint8_t{DW_CFA_def_cfa_offset});
              w.write_uleb(d.offset);
            } else {
              w.write(uint8_t{DW_CFA_def_cfa_offset_sf});
              w.write_sleb(factor(d.offset, data_alignment, "CFA offset"));
            }
          },
          [&](cfi::offset const &o) {
            if (o.factored_offset < 0) {
              w.write(uint8_t{DW_CFA_offset_extended_sf});
              w.write_uleb(o.reg);
              w.write_sleb(o.factored_offset);
            } else if (o.reg > operand_mask) {
              w.write(uint8_t{DW_CFA_offset_extended});
              w.write_uleb(o.reg);
              w.write_uleb(o.factored_offset);
            } else {
              w.write(uint8_t(DW_CFA_offset | o.reg));
              w.write_uleb(o.factored_offset);
            }
          }},
      inst);
}

encoded_frame write_debug_frame(header_entry const &table) {
  CFIGEN_THROW_IF(table.address_size != 4 && table.address_size != 8,
                  precondition_error, "unsupported address size {}",
                  table.address_size);
  CFIGEN_THROW_IF(table.version != 1 && table.version != 3 &&
                      table.version != 4,
                  precondition_error, "unsupported CIE version {}",
                  table.version);
  CFIGEN_THROW_IF(table.data_alignment == 0, precondition_error,
                  "data alignment factor must not be zero");

  encoded_frame result;
  Writer w(result.bytes);

  auto cie_offset = begin_entry(w);
  w.write(cie_id);
  w.write(table.version);
  w.write(uint8_t{0}); // augmentation ""
  if (table.version >= 4) {
    w.write(table.address_size);
    w.write(table.segment_size);
  }
  w.write_uleb(table.code_alignment);
  w.write_sleb(table.data_alignment);
  if (table.version == 1)
    w.write(cast<uint8_t>(table.return_address));
  else
    w.write_uleb(table.return_address);
  for (auto const &inst : table.initial_instructions)
    write_instruction(w, inst, table.data_alignment);
  end_entry(w, cie_offset, table.address_size);

  for (auto const &fde : table.functions) {
    auto start = begin_entry(w);
    w.write(cast<uint32_t>(cie_offset));
    result.relocations.push_back(
        {.offset = cast<uint32_t>(w.bytes_written()),
         .function_index = fde.function_index,
         .addend = cast<int64_t>(fde.initial_address),
         .size = table.address_size});
    write_address(w, 0, table.address_size);
    write_address(w, fde.length, table.address_size);
    for (auto const &inst : fde.instructions)
      write_instruction(w, inst, table.data_alignment);
    end_entry(w, start, table.address_size);
  }
  return result;
}

} // namespace cfigen
