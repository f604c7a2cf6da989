#include "cfigen/call_frame.hpp"
#include "cfigen/error.hpp"
#include "cfigen/format.hpp"
#include "cfigen/macros.hpp"
#include "cfigen/overloaded.hpp"
#include <fmt/core.h>

namespace cfigen {

frame_convention frame_convention::for_target(target_isa const &isa,
                                              register_map const &regs) {
  auto ptr = isa.pointer_bytes();
  return {.address_size = ptr,
          .code_alignment = 1,
          .data_alignment = static_cast<int8_t>(-ptr),
          .return_address = regs.return_address(),
          .cfa_register = regs.stack_pointer(),
          .cfa_offset = ptr};
}

bool is_supported(call_conv conv) noexcept {
  switch (conv) {
  case call_conv::fast:
  case call_conv::cold:
  case call_conv::system_v:
    return true;
  default:
    return false;
  }
}

cfa_state::cfa_state(register_map const &regs,
                     frame_convention const &convention)
    : _regs(regs), _data_alignment(convention.data_alignment),
      _reg(convention.cfa_register), _offset(convention.cfa_offset) {
  CFIGEN_THROW_IF(_data_alignment == 0, precondition_error,
                  "data alignment factor must not be zero");
}

void cfa_state::apply(frame_layout_command const &cmd,
                      std::vector<call_frame_instruction> &out) {
  std::visit(
      overloaded{
          [&](move_location_by const &m) {
            out.push_back(cfi::advance_loc{m.delta});
          },
          [&](call_frame_address_at const &c) {
            auto reg = _regs.map(c.reg);
            bool reg_changed = reg != _reg;
            bool offset_changed = c.offset != _offset;
            if (reg_changed && offset_changed) {
              out.push_back(cfi::def_cfa{reg, c.offset});
            } else if (offset_changed) {
              out.push_back(cfi::def_cfa_offset{c.offset});
            } else if (reg_changed) {
              out.push_back(cfi::def_cfa_register{reg});
            }
            _reg = reg;
            _offset = c.offset;
          },
          [&](register_at const &r) {
            CFIGEN_THROW_IF(r.cfa_offset % _data_alignment != 0,
                            precondition_error,
                            "register unit {} saved at CFA{:+}, which is not "
                            "a multiple of the data alignment {}",
                            r.reg, r.cfa_offset, _data_alignment);
            out.push_back(
                cfi::offset{_regs.map(r.reg), r.cfa_offset / _data_alignment});
          }},
      cmd);
}

std::vector<call_frame_instruction>
translate_frame_layout(frame_layout const &layout, register_map const &regs,
                       frame_convention const &convention) {
  CFIGEN_THROW_IF(!is_supported(layout.conv), precondition_error,
                  "calling convention {} has no System V prologue",
                  layout.conv);
  cfa_state state(regs, convention);
  std::vector<call_frame_instruction> result;
  result.reserve(layout.commands.size());
  for (auto const &cmd : layout.commands)
    state.apply(cmd, result);
  return result;
}

} // namespace cfigen
