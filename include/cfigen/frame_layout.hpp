#pragma once

#include "cfigen/isa.hpp"
#include <cstdint>
#include <variant>
#include <vector>

namespace cfigen {

struct move_location_by {
  uint32_t delta;
  bool operator==(move_location_by const &) const = default;
};
// CFA is now at reg + offset
struct call_frame_address_at {
  reg_unit reg;
  int32_t offset;
  bool operator==(call_frame_address_at const &) const = default;
};
// reg is saved at CFA + cfa_offset
struct register_at {
  reg_unit reg;
  int32_t cfa_offset;
  bool operator==(register_at const &) const = default;
};
struct remember_state {
  bool operator==(remember_state const &) const = default;
};
struct restore_state {
  bool operator==(restore_state const &) const = default;
};

using frame_layout_command =
    std::variant<move_location_by, call_frame_address_at, register_at>;

// What the backend attaches to an emitted instruction.
using frame_layout_change = std::variant<call_frame_address_at, register_at,
                                         remember_state, restore_state>;

struct frame_layout {
  call_conv conv;
  std::vector<frame_layout_command> commands;
  bool operator==(frame_layout const &) const = default;
};

struct emitted_inst {
  uint32_t offset;
  uint32_t inst;
  uint32_t size;
  uint32_t srcloc;
  std::vector<frame_layout_change> frame_changes;
};

struct emitted_block {
  uint32_t offset;
  std::vector<emitted_inst> insts;
};

// Code generator output for one function. Blocks are in layout order, which
// need not match their emitted order.
struct emitted_function {
  std::vector<uint8_t> code;
  std::vector<emitted_block> blocks;
  call_conv conv = call_conv::system_v;
};

struct instruction_address_transform {
  uint32_t srcloc;
  uint32_t code_offset;
  uint32_t code_len;
  bool operator==(instruction_address_transform const &) const = default;
};

struct function_address_transform {
  std::vector<instruction_address_transform> locations;
  uint32_t body_offset;
  uint32_t body_len;
  bool operator==(function_address_transform const &) const = default;
};

std::vector<frame_layout_command> extract_frame_layout(emitted_function const &f);
function_address_transform extract_address_transform(emitted_function const &f);

} // namespace cfigen
