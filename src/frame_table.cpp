#include "cfigen/frame_table.hpp"

namespace cfigen {

header_entry header_entry::for_convention(frame_convention const &convention) {
  // the call pushed the return address just below the CFA
  auto ra_offset = -static_cast<int32_t>(convention.address_size) /
                   convention.data_alignment;
  return {.address_size = convention.address_size,
          .code_alignment = convention.code_alignment,
          .data_alignment = convention.data_alignment,
          .return_address = convention.return_address,
          .initial_instructions = {cfi::def_cfa{convention.cfa_register,
                                                convention.cfa_offset},
                                   cfi::offset{convention.return_address,
                                               ra_offset}},
          .functions = {}};
}

function_entry make_function_entry(uint32_t function_index, uint32_t length,
                                   frame_layout const &layout,
                                   register_map const &regs,
                                   frame_convention const &convention) {
  return {.function_index = function_index,
          .initial_address = 0,
          .length = length,
          .instructions = translate_frame_layout(layout, regs, convention)};
}

} // namespace cfigen
