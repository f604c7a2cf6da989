#include "cfigen/isa.hpp"
#include <algorithm>
#include <array>
#include <fmt/core.h>

namespace {
using namespace std::string_view_literals;

// hardware encoding order
constexpr auto int_regs = std::to_array<std::string_view>(
    {"rax"sv, "rcx"sv, "rdx"sv, "rbx"sv, "rsp"sv, "rbp"sv, "rsi"sv, "rdi"sv,
     "r8"sv, "r9"sv, "r10"sv, "r11"sv, "r12"sv, "r13"sv, "r14"sv, "r15"sv});
constexpr auto float_regs = std::to_array<std::string_view>(
    {"xmm0"sv, "xmm1"sv, "xmm2"sv, "xmm3"sv, "xmm4"sv, "xmm5"sv, "xmm6"sv,
     "xmm7"sv, "xmm8"sv, "xmm9"sv, "xmm10"sv, "xmm11"sv, "xmm12"sv,
     "xmm13"sv, "xmm14"sv, "xmm15"sv});
constexpr auto flag_regs = std::to_array<std::string_view>({"rflags"sv});

constexpr auto banks = std::to_array<cfigen::register_bank>(
    {{"IntRegs", 0, int_regs},
     {"FloatRegs", 16, float_regs},
     {"FLAGS", 32, flag_regs}});

class x86_64 final : public cfigen::target_isa {
public:
  std::string_view name() const noexcept override { return "x86_64"; }
  uint8_t pointer_bytes() const noexcept override { return 8; }
  std::span<const cfigen::register_bank> register_banks() const noexcept override {
    return banks;
  }
  cfigen::reg_unit stack_pointer() const noexcept override { return 4; }
};
} // namespace

namespace cfigen {

register_bank const *target_isa::bank_of(reg_unit r) const noexcept {
  auto all = register_banks();
  auto bank = std::ranges::find_if(
      all, [r](register_bank const &b) { return b.contains(r); });
  if (bank == all.end())
    return nullptr;
  return &*bank;
}

std::string target_isa::display_regunit(reg_unit r) const {
  auto bank = bank_of(r);
  if (!bank)
    return fmt::format("%INVALID{}", r);
  return fmt::format("%{}", bank->names[r - bank->first_unit]);
}

target_isa const &x86_64_isa() {
  static const x86_64 isa;
  return isa;
}

} // namespace cfigen
