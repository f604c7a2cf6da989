#include "cfigen/format.hpp"
#include "cfigen/overloaded.hpp"
#include <fmt/core.h>

namespace cfigen {

std::string to_string(call_frame_instruction const &inst) {
  return std::visit(
      overloaded{
          [](cfi::advance_loc const &a) {
            return fmt::format("DW_CFA_advance_loc: {}", a.delta);
          },
          [](cfi::def_cfa const &d) {
            return fmt::format("DW_CFA_def_cfa: r{} ofs {}", d.reg, d.offset);
          },
          [](cfi::def_cfa_register const &d) {
            return fmt::format("DW_CFA_def_cfa_register: r{}", d.reg);
          },
          [](cfi::def_cfa_offset const &d) {
            return fmt::format("DW_CFA_def_cfa_offset: {}", d.offset);
          },
          [](cfi::offset const &o) {
            return fmt::format("DW_CFA_offset: r{} at cfa{:+}*daf", o.reg,
                               o.factored_offset);
          }},
      inst);
}

std::string to_string(frame_layout_command const &cmd) {
  return std::visit(
      overloaded{[](move_location_by const &m) {
                   return fmt::format("move_location_by {}", m.delta);
                 },
                 [](call_frame_address_at const &c) {
                   return fmt::format("cfa at unit {}{:+}", c.reg, c.offset);
                 },
                 [](register_at const &r) {
                   return fmt::format("unit {} at cfa{:+}", r.reg,
                                      r.cfa_offset);
                 }},
      cmd);
}

std::string to_string(relocation_target const &target) {
  return std::visit(
      overloaded{[](target::user_func const &u) {
                   return fmt::format("u0:{}", u.index);
                 },
                 [](target::builtin const &b) -> std::string {
                   switch (b.op) {
                   case builtin_op::memory32_grow:
                     return "memory32_grow";
                   case builtin_op::imported_memory32_grow:
                     return "imported_memory32_grow";
                   case builtin_op::memory32_size:
                     return "memory32_size";
                   case builtin_op::imported_memory32_size:
                     return "imported_memory32_size";
                   }
                   return "???";
                 },
                 [](target::lib_call const &l) {
                   return std::string(to_string(l.call));
                 }},
      target);
}

std::string_view to_string(libcall call) noexcept {
  switch (call) {
  case libcall::probestack:
    return "probestack";
  case libcall::ceil_f32:
    return "ceil_f32";
  case libcall::ceil_f64:
    return "ceil_f64";
  case libcall::floor_f32:
    return "floor_f32";
  case libcall::floor_f64:
    return "floor_f64";
  case libcall::trunc_f32:
    return "trunc_f32";
  case libcall::trunc_f64:
    return "trunc_f64";
  case libcall::nearest_f32:
    return "nearest_f32";
  case libcall::nearest_f64:
    return "nearest_f64";
  }
  return "???";
}

std::string_view to_string(compile_stage stage) noexcept {
  switch (stage) {
  case compile_stage::translate:
    return "translate";
  case compile_stage::codegen:
    return "codegen";
  case compile_stage::frame_layout:
    return "frame_layout";
  case compile_stage::unwind:
    return "unwind";
  }
  return "???";
}

std::string_view to_string(call_conv conv) noexcept {
  switch (conv) {
  case call_conv::fast:
    return "fast";
  case call_conv::cold:
    return "cold";
  case call_conv::system_v:
    return "system_v";
  case call_conv::windows_fastcall:
    return "windows_fastcall";
  case call_conv::baldrdash_system_v:
    return "baldrdash_system_v";
  case call_conv::probestack:
    return "probestack";
  }
  return "???";
}

} // namespace cfigen
