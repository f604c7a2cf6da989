#include "cfigen/register_map.hpp"
#include "cfigen/error.hpp"
#include <algorithm>
#include <array>
#include <fmt/core.h>
#include <span>
#include <string_view>

namespace {
using cfigen::dwarf_reg;
using kind = cfigen::register_mapping_error::kind;

struct dwarf_name {
  std::string_view name;
  dwarf_reg reg;
};

struct arch_table {
  std::string_view arch;
  std::span<const std::string_view> banks;
  std::span<const dwarf_name> names;
  dwarf_reg return_address;
};

namespace x86_64 {
constexpr auto banks = std::to_array<std::string_view>({"IntRegs", "FloatRegs"});
// System V psABI, figure 3.36
constexpr auto names = std::to_array<dwarf_name>({
    {"%rax", 0},    {"%rdx", 1},    {"%rcx", 2},    {"%rbx", 3},
    {"%rsi", 4},    {"%rdi", 5},    {"%rbp", 6},    {"%rsp", 7},
    {"%r8", 8},     {"%r9", 9},     {"%r10", 10},   {"%r11", 11},
    {"%r12", 12},   {"%r13", 13},   {"%r14", 14},   {"%r15", 15},
    {"%xmm0", 17},  {"%xmm1", 18},  {"%xmm2", 19},  {"%xmm3", 20},
    {"%xmm4", 21},  {"%xmm5", 22},  {"%xmm6", 23},  {"%xmm7", 24},
    {"%xmm8", 25},  {"%xmm9", 26},  {"%xmm10", 27}, {"%xmm11", 28},
    {"%xmm12", 29}, {"%xmm13", 30}, {"%xmm14", 31}, {"%xmm15", 32},
});
constexpr dwarf_reg return_address = 16;
} // namespace x86_64

constexpr auto arch_tables = std::to_array<arch_table>(
    {{"x86_64", x86_64::banks, x86_64::names, x86_64::return_address}});

} // namespace

namespace cfigen {

register_map::register_map(target_isa const &isa) : _isa(isa) {
  auto table = std::ranges::find(arch_tables, isa.name(), &arch_table::arch);
  if (table == arch_tables.end()) {
    throw register_mapping_error(
        kind::unsupported_architecture,
        fmt::format("register mapping is currently only implemented for "
                    "x86_64, not {}",
                    isa.name()));
  }

  for (auto const &bank : isa.register_banks()) {
    if (std::ranges::find(table->banks, bank.name) == table->banks.end())
      continue;
    for (size_t i = 0; i < bank.names.size(); ++i) {
      auto unit = static_cast<reg_unit>(bank.first_unit + i);
      auto display = isa.display_regunit(unit);
      auto found = std::ranges::find_if(table->names, [&](dwarf_name const &n) {
        return n.name == display;
      });
      if (found == table->names.end()) {
        throw register_mapping_error(
            kind::unsupported_register_bank,
            fmt::format("no DWARF number for {} in bank {}", display,
                        bank.name));
      }
      _table.emplace(unit, found->reg);
    }
  }

  _stack_pointer = map(isa.stack_pointer());
  _return_address = table->return_address;
}

dwarf_reg register_map::map(reg_unit unit) const {
  if (auto it = _table.find(unit); it != _table.end())
    return it->second;

  auto bank = _isa.bank_of(unit);
  if (!bank) {
    throw register_mapping_error(
        kind::missing_bank,
        fmt::format("unable to find bank for register unit {}", unit));
  }
  throw register_mapping_error(
      kind::unsupported_register_bank,
      fmt::format("unsupported register bank: {} ({})", bank->name,
                  _isa.display_regunit(unit)));
}

} // namespace cfigen
