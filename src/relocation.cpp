#include "cfigen/relocation.hpp"
#include "cfigen/error.hpp"
#include "cfigen/overloaded.hpp"
#include <fmt/core.h>

namespace cfigen {

relocation_target classify(external_name const &name) {
  return std::visit(
      overloaded{
          [](name::user const &u) -> relocation_target {
            if (u.ns == function_namespace)
              return target::user_func{u.index};
            if (u.ns == builtin_namespace &&
                u.index <= uint32_t(builtin_op::imported_memory32_size))
              return target::builtin{builtin_op(u.index)};
            throw unsupported_directive(fmt::format(
                "unrecognized external name u{}:{}", u.ns, u.index));
          },
          [](name::lib_call const &l) -> relocation_target {
            return target::lib_call{l.call};
          },
          [](name::symbol const &s) -> relocation_target {
            throw unsupported_directive(
                fmt::format("unrecognized external name {}", s.name));
          }},
      name);
}

void reloc_sink::reloc_block(uint32_t offset, reloc_kind, uint32_t block_offset) {
  throw unsupported_directive(
      fmt::format("block relocation at {:#x} to block at {:#x} is not "
                  "implemented",
                  offset, block_offset));
}

void reloc_sink::reloc_external(uint32_t offset, reloc_kind kind,
                                external_name const &name, int64_t addend) {
  func_relocs.push_back({.kind = kind,
                         .target = classify(name),
                         .offset = offset,
                         .addend = addend});
}

void reloc_sink::reloc_jump_table(uint32_t offset, reloc_kind,
                                  uint32_t jump_table) {
  throw unsupported_directive(
      fmt::format("jump table {} relocation at {:#x} is not implemented",
                  jump_table, offset));
}

} // namespace cfigen
