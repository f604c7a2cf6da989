#pragma once

#include "cfigen/call_frame.hpp"
#include "cfigen/frame_layout.hpp"
#include "cfigen/frame_table.hpp"
#include "cfigen/isa.hpp"
#include "cfigen/relocation.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace cfigen {

enum class value_type : uint8_t { i32, i64, f32, f64 };

struct signature {
  std::vector<value_type> params;
  std::vector<value_type> returns;
  call_conv conv = call_conv::system_v;
};

struct module_info {
  std::vector<signature> signatures;
  // signature index of every function, imported ones first
  std::vector<uint32_t> functions;
  uint32_t imported_functions = 0;

  uint32_t func_index(uint32_t defined_index) const noexcept {
    return imported_functions + defined_index;
  }
  signature const &signature_of(uint32_t func_index) const {
    return signatures.at(functions.at(func_index));
  }
};

struct function_body {
  std::span<const uint8_t> data;
  size_t module_offset;
};

// Backend-specific intermediate form of one function.
class function_ir {
public:
  virtual ~function_ir() = default;
};

// Bytecode translation and code generation. Called concurrently from the
// compile workers, so implementations must not mutate shared state.
class backend {
public:
  virtual ~backend() = default;
  virtual target_isa const &isa() const noexcept = 0;
  virtual std::unique_ptr<function_ir> translate(module_info const &module,
                                                 uint32_t func_index,
                                                 function_body const &body) const = 0;
  virtual emitted_function emit(function_ir &ir, reloc_sink &sink) const = 0;
};

struct compile_options {
  bool generate_debug_info = false;
  // 0 picks std::thread::hardware_concurrency()
  unsigned threads = 0;
  bool verbose = false;
};

struct compiled_function {
  std::vector<uint8_t> code;
  std::vector<relocation> relocations;
  std::optional<function_address_transform> address_transform;
  std::optional<frame_layout> layout;
  std::optional<function_entry> unwind;
};

struct compilation {
  // indexed by defined function index
  std::vector<compiled_function> functions;
  // present when debug info was generated
  std::optional<frame_convention> convention;

  std::vector<std::vector<relocation>> relocations() const;
  std::vector<function_address_transform> address_transforms() const;
  std::vector<frame_layout> frame_layouts() const;
};

/* Compiles every function body on a pool of worker threads. Results keep the
   order of `bodies` no matter which worker finished first. If any function
   fails, every function still runs to completion and the failure with the
   lowest index is thrown as compile_error; nothing is returned. */
compilation compile_module(module_info const &module,
                           std::span<const function_body> bodies,
                           backend const &b, compile_options const &options = {});

header_entry build_frame_table(compilation const &c);
encoded_frame emit_debug_frame(compilation const &c);

} // namespace cfigen
