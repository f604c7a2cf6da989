#pragma once

#include "cfigen/call_frame.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cfigen {

struct decoded_cie {
  uint64_t offset;
  uint8_t version;
  std::string augmentation;
  uint8_t address_size;
  uint8_t segment_size;
  uint64_t code_alignment;
  int64_t data_alignment;
  uint64_t return_address;
  std::vector<call_frame_instruction> instructions;
};

struct decoded_fde {
  uint64_t offset;
  uint64_t cie_offset;
  uint64_t initial_address;
  uint64_t address_range;
  std::vector<call_frame_instruction> instructions;
};

struct decoded_frame {
  std::vector<decoded_cie> cies;
  std::vector<decoded_fde> fdes;
};

std::vector<call_frame_instruction>
parse_instructions(std::span<const uint8_t> data, int64_t data_alignment);

// Contents of a .debug_frame section. Padding (DW_CFA_nop) is dropped and
// the factored/extended forms map back onto their plain instruction.
decoded_frame read_debug_frame(std::span<const uint8_t> section,
                               uint8_t default_address_size = 8);

} // namespace cfigen
