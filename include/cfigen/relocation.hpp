#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cfigen {

enum class reloc_kind : uint8_t {
  abs4,
  abs8,
  x86_pc_rel4,
  x86_call_pc_rel4,
  x86_call_plt_rel4,
  x86_got_pc_rel4
};

enum class builtin_op : uint8_t {
  memory32_grow,
  imported_memory32_grow,
  memory32_size,
  imported_memory32_size
};

enum class libcall : uint8_t {
  probestack,
  ceil_f32,
  ceil_f64,
  floor_f32,
  floor_f64,
  trunc_f32,
  trunc_f64,
  nearest_f32,
  nearest_f64
};

namespace target {
struct user_func {
  uint32_t index;
  bool operator==(user_func const &) const = default;
};
struct builtin {
  builtin_op op;
  bool operator==(builtin const &) const = default;
};
struct lib_call {
  libcall call;
  bool operator==(lib_call const &) const = default;
};
} // namespace target

using relocation_target =
    std::variant<target::user_func, target::builtin, target::lib_call>;

struct relocation {
  reloc_kind kind;
  relocation_target target;
  uint32_t offset;
  int64_t addend;
  bool operator==(relocation const &) const = default;
};

// Names the code generator refers to in emitted code.
namespace name {
struct user {
  uint32_t ns;
  uint32_t index;
};
struct lib_call {
  libcall call;
};
struct symbol {
  std::string name;
};
} // namespace name

using external_name = std::variant<name::user, name::lib_call, name::symbol>;

// user namespace 0 holds functions, 1 the memory built-ins
constexpr uint32_t function_namespace = 0;
constexpr uint32_t builtin_namespace = 1;

inline external_name builtin_name(builtin_op op) {
  return name::user{builtin_namespace, static_cast<uint32_t>(op)};
}

// Collects the relocations of one function while it is emitted.
class reloc_sink {
public:
  void reloc_block(uint32_t offset, reloc_kind kind, uint32_t block_offset);
  void reloc_external(uint32_t offset, reloc_kind kind,
                      external_name const &name, int64_t addend);
  void reloc_jump_table(uint32_t offset, reloc_kind kind, uint32_t jump_table);

  std::vector<relocation> func_relocs;
};

relocation_target classify(external_name const &name);

} // namespace cfigen
