#pragma once

#include "cfigen/isa.hpp"
#include <cstdint>
#include <unordered_map>

namespace cfigen {

// DWARF register number
using dwarf_reg = uint16_t;

// Built once per architecture, then shared read-only between compile tasks.
class register_map {
public:
  explicit register_map(target_isa const &isa);

  dwarf_reg map(reg_unit unit) const;
  dwarf_reg stack_pointer() const noexcept { return _stack_pointer; }
  dwarf_reg return_address() const noexcept { return _return_address; }
  size_t size() const noexcept { return _table.size(); }

private:
  target_isa const &_isa;
  std::unordered_map<reg_unit, dwarf_reg> _table;
  dwarf_reg _stack_pointer{}, _return_address{};
};

} // namespace cfigen
