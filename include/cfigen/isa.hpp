#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace cfigen {

// Register unit in the backend's register file.
using reg_unit = uint16_t;

enum class call_conv : uint8_t {
  fast,
  cold,
  system_v,
  windows_fastcall,
  baldrdash_system_v,
  probestack
};

struct register_bank {
  std::string_view name;
  reg_unit first_unit;
  // display names without the leading '%', indexed by unit - first_unit
  std::span<const std::string_view> names;

  constexpr bool contains(reg_unit r) const noexcept {
    return r >= first_unit && size_t(r - first_unit) < names.size();
  }
};

class target_isa {
public:
  virtual ~target_isa() = default;

  virtual std::string_view name() const noexcept = 0;
  virtual uint8_t pointer_bytes() const noexcept = 0;
  virtual std::span<const register_bank> register_banks() const noexcept = 0;
  virtual reg_unit stack_pointer() const noexcept = 0;

  register_bank const *bank_of(reg_unit r) const noexcept;
  // "%rax", or "%INVALID{unit}" for units outside every bank
  std::string display_regunit(reg_unit r) const;
};

target_isa const &x86_64_isa();

} // namespace cfigen
