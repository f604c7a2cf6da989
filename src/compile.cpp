#include "cfigen/compile.hpp"
#include "cfigen/cast.hpp"
#include "cfigen/error.hpp"
#include "cfigen/format.hpp"
#include "cfigen/macros.hpp"
#include "cfigen/register_map.hpp"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <exception>
#include <fmt/core.h>
#include <string>
#include <thread>

namespace {
using namespace cfigen;

struct debug_context {
  register_map regs;
  frame_convention convention;

  explicit debug_context(target_isa const &isa)
      : regs(isa), convention(frame_convention::for_target(isa, regs)) {}
};

struct slot {
  std::optional<compiled_function> result;
  std::exception_ptr failure;
  compile_stage stage = compile_stage::translate;
};

unsigned worker_count(compile_options const &options, size_t jobs) {
  unsigned threads = options.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0)
      threads = 4;
  }
  return static_cast<unsigned>(
      std::min<size_t>(threads, std::max<size_t>(jobs, 1)));
}

compiled_function compile_function(module_info const &module, uint32_t index,
                                   function_body const &body, backend const &b,
                                   debug_context const *debug,
                                   compile_stage &stage) {
  stage = compile_stage::translate;
  auto ir = b.translate(module, module.func_index(index), body);
  CFIGEN_REQUIRE(ir != nullptr);

  stage = compile_stage::codegen;
  reloc_sink sink;
  auto emitted = b.emit(*ir, sink);

  compiled_function result{.code = {},
                           .relocations = std::move(sink.func_relocs),
                           .address_transform = std::nullopt,
                           .layout = std::nullopt,
                           .unwind = std::nullopt};
  if (debug) {
    stage = compile_stage::frame_layout;
    result.address_transform = extract_address_transform(emitted);
    result.layout = frame_layout{emitted.conv, extract_frame_layout(emitted)};

    stage = compile_stage::unwind;
    result.unwind =
        make_function_entry(index, cast<uint32_t>(emitted.code.size()),
                            *result.layout, debug->regs, debug->convention);
  }
  result.code = std::move(emitted.code);
  return result;
}

std::string describe(std::exception_ptr const &e) {
  try {
    std::rethrow_exception(e);
  } catch (std::exception const &ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}
} // namespace

namespace cfigen {

compilation compile_module(module_info const &module,
                           std::span<const function_body> bodies,
                           backend const &b, compile_options const &options) {
  compilation result;
  // built before any worker starts; workers only read it
  std::optional<debug_context> debug;
  if (options.generate_debug_info) {
    debug.emplace(b.isa());
    result.convention = debug->convention;
  }

  std::vector<slot> slots(bodies.size());
  std::atomic<size_t> next_index{0};
  auto worker = [&] {
    while (true) {
      size_t index = next_index.fetch_add(1);
      if (index >= bodies.size())
        break;
      auto &s = slots[index];
      try {
        s.result = compile_function(module, static_cast<uint32_t>(index),
                                    bodies[index], b,
                                    debug ? &*debug : nullptr, s.stage);
        if (options.verbose) {
          fmt::print(stderr, "function {}: {} bytes, {} relocations\n", index,
                     s.result->code.size(), s.result->relocations.size());
        }
      } catch (...) {
        s.failure = std::current_exception();
      }
    }
  };

  auto threads = worker_count(options, bodies.size());
  if (options.verbose) {
    fmt::print(stderr, "compiling {} functions on {} threads\n",
               bodies.size(), threads);
  }
  {
    std::vector<std::jthread> workers;
    workers.reserve(threads);
    for (unsigned i = 0; i < threads; ++i)
      workers.emplace_back(worker);
  }

  for (size_t i = 0; i < slots.size(); ++i) {
    auto const &s = slots[i];
    if (s.failure) {
      throw compile_error(static_cast<uint32_t>(i), s.stage,
                          fmt::format("function {} failed during {}: {}", i,
                                      s.stage, describe(s.failure)),
                          s.failure);
    }
  }

  result.functions.reserve(slots.size());
  for (auto &s : slots)
    result.functions.push_back(std::move(*s.result));
  return result;
}

std::vector<std::vector<relocation>> compilation::relocations() const {
  std::vector<std::vector<relocation>> result;
  result.reserve(functions.size());
  for (auto const &f : functions)
    result.push_back(f.relocations);
  return result;
}

std::vector<function_address_transform> compilation::address_transforms() const {
  std::vector<function_address_transform> result;
  for (auto const &f : functions) {
    if (f.address_transform)
      result.push_back(*f.address_transform);
  }
  return result;
}

std::vector<frame_layout> compilation::frame_layouts() const {
  std::vector<frame_layout> result;
  for (auto const &f : functions) {
    if (f.layout)
      result.push_back(*f.layout);
  }
  return result;
}

header_entry build_frame_table(compilation const &c) {
  CFIGEN_THROW_IF(!c.convention, precondition_error,
                  "module was compiled without debug info");
  auto table = header_entry::for_convention(*c.convention);
  table.functions.reserve(c.functions.size());
  for (auto const &f : c.functions) {
    if (f.unwind)
      table.functions.push_back(*f.unwind);
  }
  return table;
}

encoded_frame emit_debug_frame(compilation const &c) {
  return write_debug_frame(build_frame_table(c));
}

} // namespace cfigen
