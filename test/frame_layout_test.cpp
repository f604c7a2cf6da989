#include "cfigen/error.hpp"
#include "cfigen/frame_layout.hpp"
#include <gtest/gtest.h>

using namespace cfigen;

namespace {
emitted_inst inst(uint32_t offset, uint32_t size,
                  std::vector<frame_layout_change> changes = {},
                  uint32_t srcloc = 0) {
  return {.offset = offset,
          .inst = 0,
          .size = size,
          .srcloc = srcloc,
          .frame_changes = std::move(changes)};
}

// push %rbp; mov %rsp, %rbp; ...; ret
emitted_function prologue() {
  emitted_function f;
  f.code.resize(16);
  f.blocks = {{.offset = 0,
               .insts = {inst(0, 1,
                              {call_frame_address_at{4, 16},
                               register_at{5, -16}},
                              1),
                         inst(1, 3, {call_frame_address_at{5, 16}}, 2),
                         inst(4, 12, {}, 3)}}};
  return f;
}
} // namespace

TEST(FrameLayout, PrologueCommands) {
  auto commands = extract_frame_layout(prologue());
  std::vector<frame_layout_command> expected = {
      move_location_by{1}, call_frame_address_at{4, 16}, register_at{5, -16},
      move_location_by{3}, call_frame_address_at{5, 16}};
  EXPECT_EQ(commands, expected);
}

TEST(FrameLayout, NoChangesNoCommands) {
  emitted_function f;
  f.blocks = {{.offset = 0, .insts = {inst(0, 4), inst(4, 4)}}};
  EXPECT_TRUE(extract_frame_layout(f).empty());
}

TEST(FrameLayout, ChangeAtOffsetZeroHasNoMove) {
  emitted_function f;
  f.blocks = {{.offset = 0,
               .insts = {inst(0, 0, {call_frame_address_at{4, 16}})}}};
  std::vector<frame_layout_command> expected = {call_frame_address_at{4, 16}};
  EXPECT_EQ(extract_frame_layout(f), expected);
}

TEST(FrameLayout, BlocksVisitedInEmittedOrder) {
  emitted_function f;
  f.blocks = {
      {.offset = 8, .insts = {inst(8, 2, {call_frame_address_at{4, 8}})}},
      {.offset = 0, .insts = {inst(0, 4, {call_frame_address_at{4, 16}})}},
  };
  std::vector<frame_layout_command> expected = {
      move_location_by{4}, call_frame_address_at{4, 16}, move_location_by{6},
      call_frame_address_at{4, 8}};
  EXPECT_EQ(extract_frame_layout(f), expected);
}

TEST(FrameLayout, OffsetsGoingBackwardsFail) {
  emitted_function f;
  f.blocks = {{.offset = 0,
               .insts = {inst(8, 2, {call_frame_address_at{4, 16}}),
                         inst(2, 2, {call_frame_address_at{4, 8}})}}};
  EXPECT_THROW(extract_frame_layout(f), precondition_error);
}

TEST(FrameLayout, RememberStateIsUnsupported) {
  emitted_function f;
  f.blocks = {{.offset = 0, .insts = {inst(0, 1, {remember_state{}})}}};
  EXPECT_THROW(extract_frame_layout(f), unsupported_directive);
  f.blocks = {{.offset = 0, .insts = {inst(0, 1, {restore_state{}})}}};
  EXPECT_THROW(extract_frame_layout(f), unsupported_directive);
}

TEST(AddressTransform, OneLocationPerInstruction) {
  auto transform = extract_address_transform(prologue());
  EXPECT_EQ(transform.body_offset, 0u);
  EXPECT_EQ(transform.body_len, 16u);
  std::vector<instruction_address_transform> expected = {
      {.srcloc = 1, .code_offset = 0, .code_len = 1},
      {.srcloc = 2, .code_offset = 1, .code_len = 3},
      {.srcloc = 3, .code_offset = 4, .code_len = 12}};
  EXPECT_EQ(transform.locations, expected);
}
