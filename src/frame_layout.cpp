#include "cfigen/frame_layout.hpp"
#include "cfigen/cast.hpp"
#include "cfigen/error.hpp"
#include "cfigen/macros.hpp"
#include "cfigen/overloaded.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace {
using namespace cfigen;

// emitted order, so instruction offsets only ever increase
std::vector<emitted_block const *> sorted_blocks(emitted_function const &f) {
  std::vector<emitted_block const *> blocks;
  blocks.reserve(f.blocks.size());
  for (auto const &b : f.blocks)
    blocks.push_back(&b);
  std::ranges::stable_sort(blocks, {}, &emitted_block::offset);
  return blocks;
}

frame_layout_command to_command(frame_layout_change const &change,
                                uint32_t offset) {
  return std::visit(
      overloaded{
          [](call_frame_address_at c) -> frame_layout_command { return c; },
          [](register_at c) -> frame_layout_command { return c; },
          [&](remember_state) -> frame_layout_command {
            throw unsupported_directive(fmt::format(
                "remember_state at {:#x} is not supported", offset));
          },
          [&](restore_state) -> frame_layout_command {
            throw unsupported_directive(fmt::format(
                "restore_state at {:#x} is not supported", offset));
          }},
      change);
}
} // namespace

namespace cfigen {

std::vector<frame_layout_command> extract_frame_layout(emitted_function const &f) {
  std::vector<frame_layout_command> result;
  uint32_t last_offset = 0;
  for (auto block : sorted_blocks(f)) {
    for (auto const &inst : block->insts) {
      if (inst.frame_changes.empty())
        continue;
      auto address_offset = inst.offset + inst.size;
      CFIGEN_THROW_IF(address_offset < last_offset, precondition_error,
                      "instruction {} ends at {:#x}, before the last frame "
                      "change at {:#x}",
                      inst.inst, address_offset, last_offset);
      if (address_offset != last_offset)
        result.push_back(move_location_by{address_offset - last_offset});
      for (auto const &change : inst.frame_changes)
        result.push_back(to_command(change, address_offset));
      last_offset = address_offset;
    }
  }
  return result;
}

function_address_transform extract_address_transform(emitted_function const &f) {
  function_address_transform result{.locations = {},
                                    .body_offset = 0,
                                    .body_len = cast<uint32_t>(f.code.size())};
  for (auto block : sorted_blocks(f)) {
    for (auto const &inst : block->insts) {
      result.locations.push_back({.srcloc = inst.srcloc,
                                  .code_offset = inst.offset,
                                  .code_len = inst.size});
    }
  }
  return result;
}

} // namespace cfigen
