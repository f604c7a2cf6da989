#pragma once

#include "cfigen/binary.hpp"
#include "cfigen/call_frame.hpp"
#include "cfigen/dwarf.hpp"
#include <cstdint>
#include <vector>

namespace cfigen {

// A field holding the start address of function_index, to be patched once
// final code addresses are known.
struct relocation_slot {
  uint32_t offset;
  uint32_t function_index;
  int64_t addend;
  uint8_t size;
  bool operator==(relocation_slot const &) const = default;
};

struct function_entry {
  uint32_t function_index;
  uint64_t initial_address = 0;
  uint32_t length;
  std::vector<call_frame_instruction> instructions;
  bool operator==(function_entry const &) const = default;
};

struct header_entry {
  uint8_t version = dwarf::cie_version;
  uint8_t address_size;
  uint8_t segment_size = 0;
  uint8_t code_alignment;
  int8_t data_alignment;
  dwarf_reg return_address;
  std::vector<call_frame_instruction> initial_instructions;
  std::vector<function_entry> functions;

  static header_entry for_convention(frame_convention const &convention);
};

struct encoded_frame {
  std::vector<uint8_t> bytes;
  std::vector<relocation_slot> relocations;
};

function_entry make_function_entry(uint32_t function_index, uint32_t length,
                                   frame_layout const &layout,
                                   register_map const &regs,
                                   frame_convention const &convention);

void write_instruction(Writer &w, call_frame_instruction const &inst,
                       int8_t data_alignment);

// .debug_frame section contents: the header entry, then each function entry.
encoded_frame write_debug_frame(header_entry const &table);

} // namespace cfigen
