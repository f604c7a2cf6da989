#pragma once

#include "cfigen/frame_layout.hpp"
#include "cfigen/isa.hpp"
#include "cfigen/register_map.hpp"
#include <cstdint>
#include <variant>
#include <vector>

namespace cfigen {

namespace cfi {
struct advance_loc {
  uint32_t delta;
  bool operator==(advance_loc const &) const = default;
};
struct def_cfa {
  dwarf_reg reg;
  int32_t offset;
  bool operator==(def_cfa const &) const = default;
};
struct def_cfa_register {
  dwarf_reg reg;
  bool operator==(def_cfa_register const &) const = default;
};
struct def_cfa_offset {
  int32_t offset;
  bool operator==(def_cfa_offset const &) const = default;
};
struct offset {
  dwarf_reg reg;
  int32_t factored_offset;
  bool operator==(offset const &) const = default;
};
} // namespace cfi

using call_frame_instruction =
    std::variant<cfi::advance_loc, cfi::def_cfa, cfi::def_cfa_register,
                 cfi::def_cfa_offset, cfi::offset>;

// Alignment factors and the CFA rule every function starts with.
struct frame_convention {
  uint8_t address_size;
  uint8_t code_alignment;
  int8_t data_alignment;
  dwarf_reg return_address;
  dwarf_reg cfa_register;
  int32_t cfa_offset;

  // CFA = stack pointer + return address size
  static frame_convention for_target(target_isa const &isa,
                                     register_map const &regs);
};

bool is_supported(call_conv conv) noexcept;

class cfa_state {
public:
  cfa_state(register_map const &regs, frame_convention const &convention);

  void apply(frame_layout_command const &cmd,
             std::vector<call_frame_instruction> &out);

  dwarf_reg cfa_register() const noexcept { return _reg; }
  int32_t cfa_offset() const noexcept { return _offset; }

private:
  register_map const &_regs;
  int8_t _data_alignment;
  dwarf_reg _reg;
  int32_t _offset;
};

std::vector<call_frame_instruction>
translate_frame_layout(frame_layout const &layout, register_map const &regs,
                       frame_convention const &convention);

} // namespace cfigen
