#include "cfigen/call_frame.hpp"
#include "cfigen/error.hpp"
#include "cfigen/format.hpp"
#include "cfigen/register_map.hpp"
#include <fmt/core.h>
#include <gtest/gtest.h>

using namespace cfigen;

namespace {
// units in encoding order: 1 is rcx (DWARF 2), 2 is rdx (DWARF 1),
// 3 is rbx (DWARF 3), 4 is rsp (DWARF 7)
constexpr reg_unit rcx = 1, rdx = 2, rbx = 3, rsp = 4;

class CfaState : public ::testing::Test {
protected:
  register_map regs{x86_64_isa()};
  frame_convention convention =
      frame_convention::for_target(x86_64_isa(), regs);

  std::vector<call_frame_instruction>
  run(std::vector<frame_layout_command> const &commands) {
    cfa_state state(regs, convention);
    std::vector<call_frame_instruction> out;
    for (auto const &c : commands)
      state.apply(c, out);
    return out;
  }
};
} // namespace

TEST_F(CfaState, ConventionForX86_64) {
  EXPECT_EQ(convention.address_size, 8);
  EXPECT_EQ(convention.code_alignment, 1);
  EXPECT_EQ(convention.data_alignment, -8);
  EXPECT_EQ(convention.return_address, 16);
  EXPECT_EQ(convention.cfa_register, 7);
  EXPECT_EQ(convention.cfa_offset, 8);
}

TEST_F(CfaState, RegisterAndOffsetChanged) {
  std::vector<call_frame_instruction> expected = {cfi::def_cfa{1, 16}};
  EXPECT_EQ(run({call_frame_address_at{rdx, 16}}), expected);
}

TEST_F(CfaState, OnlyOffsetChanged) {
  std::vector<call_frame_instruction> expected = {cfi::def_cfa_offset{16}};
  EXPECT_EQ(run({call_frame_address_at{rsp, 16}}), expected);
}

TEST_F(CfaState, OnlyRegisterChanged) {
  std::vector<call_frame_instruction> expected = {cfi::def_cfa_register{3}};
  EXPECT_EQ(run({call_frame_address_at{rbx, 8}}), expected);
}

TEST_F(CfaState, NothingChanged) {
  EXPECT_TRUE(run({call_frame_address_at{rsp, 8}}).empty());
}

TEST_F(CfaState, RepeatedRuleEmitsOnce) {
  std::vector<call_frame_instruction> expected = {cfi::def_cfa_register{2}};
  EXPECT_EQ(run({call_frame_address_at{rcx, 8}, call_frame_address_at{rcx, 8}}),
            expected);
}

TEST_F(CfaState, SameRuleTwiceEmitsNothing) {
  cfa_state state(regs, convention);
  std::vector<call_frame_instruction> out;
  state.apply(call_frame_address_at{rcx, 16}, out);
  state.apply(call_frame_address_at{rcx, 8}, out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(state.cfa_register(), 2);
  EXPECT_EQ(state.cfa_offset(), 8);

  out.clear();
  state.apply(call_frame_address_at{rcx, 8}, out);
  state.apply(call_frame_address_at{rcx, 8}, out);
  EXPECT_TRUE(out.empty());
}

TEST_F(CfaState, ZeroDataAlignmentFails) {
  convention.data_alignment = 0;
  EXPECT_THROW({ cfa_state state(regs, convention); }, precondition_error);
}

TEST_F(CfaState, TracksCurrentRule) {
  cfa_state state(regs, convention);
  std::vector<call_frame_instruction> out;
  state.apply(call_frame_address_at{rbx, 32}, out);
  EXPECT_EQ(state.cfa_register(), 3);
  EXPECT_EQ(state.cfa_offset(), 32);
}

TEST_F(CfaState, MoveLocationBecomesAdvance) {
  std::vector<call_frame_instruction> expected = {cfi::advance_loc{5}};
  EXPECT_EQ(run({move_location_by{5}}), expected);
}

TEST_F(CfaState, SavedRegisterIsFactored) {
  std::vector<call_frame_instruction> expected = {cfi::offset{3, 2}};
  EXPECT_EQ(run({register_at{rbx, -16}}), expected);
}

TEST_F(CfaState, MisalignedSaveFails) {
  EXPECT_THROW(run({register_at{rbx, -15}}), precondition_error);
}

TEST_F(CfaState, UnmappableRegisterFails) {
  EXPECT_THROW(run({register_at{32, -16}}), register_mapping_error);
}

TEST_F(CfaState, TranslateChecksCallingConvention) {
  frame_layout layout{.conv = call_conv::system_v,
                      .commands = {move_location_by{1},
                                   call_frame_address_at{rsp, 16},
                                   register_at{5, -16}}};
  std::vector<call_frame_instruction> expected = {
      cfi::advance_loc{1}, cfi::def_cfa_offset{16}, cfi::offset{6, 2}};
  EXPECT_EQ(translate_frame_layout(layout, regs, convention), expected);

  layout.conv = call_conv::windows_fastcall;
  EXPECT_THROW(translate_frame_layout(layout, regs, convention),
               precondition_error);
}

TEST(CallFrameFormat, Instructions) {
  EXPECT_EQ(fmt::format("{}", call_frame_instruction{cfi::def_cfa{7, 8}}),
            "DW_CFA_def_cfa: r7 ofs 8");
  EXPECT_EQ(fmt::format("{}", call_frame_instruction{cfi::advance_loc{4}}),
            "DW_CFA_advance_loc: 4");
  EXPECT_EQ(fmt::format("{}", frame_layout_command{register_at{3, -16}}),
            "unit 3 at cfa-16");
  EXPECT_EQ(fmt::format("{}", compile_stage::frame_layout), "frame_layout");
  EXPECT_EQ(fmt::format("{}", call_conv::system_v), "system_v");
}
