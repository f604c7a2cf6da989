#include "cfigen/elf/elf.hpp"
#include "cfigen/error.hpp"
#include "cfigen/format.hpp"
#include "cfigen/io.hpp"
#include "cfigen/read_frame.hpp"
#include <cstdio>
#include <ctre.hpp>
#include <exception>
#include <fmt/core.h>
#include <span>
#include <string>
#include <vector>

namespace {

void print_instructions(
    std::vector<cfigen::call_frame_instruction> const &instructions) {
  for (auto &inst : instructions) {
    fmt::print("    {}\n", inst);
  }
}

void dump(std::span<const uint8_t> section, uint8_t address_size) {
  auto frame = cfigen::read_debug_frame(section, address_size);
  if (frame.cies.empty() && frame.fdes.empty()) {
    fmt::print("No entries\n");
    return;
  }

  for (auto &cie : frame.cies) {
    fmt::print("{:08x} CIE version {} \"{}\"\n", cie.offset, cie.version,
               cie.augmentation);
    fmt::print("  address size: {}, segment size: {}\n", cie.address_size,
               cie.segment_size);
    fmt::print("  code alignment: {}, data alignment: {}, return address: "
               "r{}\n",
               cie.code_alignment, cie.data_alignment, cie.return_address);
    print_instructions(cie.instructions);
  }

  for (auto &fde : frame.fdes) {
    fmt::print("{:08x} FDE cie={:08x} pc=[{:#x}, {:#x})\n", fde.offset,
               fde.cie_offset, fde.initial_address,
               fde.initial_address + fde.address_range);
    print_instructions(fde.instructions);
  }
}

} // namespace

int main(int argc, char **argv) {
  if (argc != 2) {
    fmt::print(stderr, "usage: {} <object.o | object.elf | frame.bin>\n",
               argv[0]);
    return 2;
  }
  std::string path = argv[1];

  try {
    auto buffer = cfigen::read_file(path);
    if (ctre::match<R"(.+\.(o|elf))">(path)) {
      auto object = cfigen::elf::parse_buffer(buffer);
      fmt::print("{}: {} {}\n", path, object.machine, object.type);
      auto &section = object.get_section(".debug_frame");
      dump(section.data, object.address_size());
    } else {
      dump(buffer, 8);
    }
  } catch (cfigen::error const &e) {
    fmt::print(stderr, "{}: {}\n", path, e.what());
    return 1;
  } catch (std::exception const &e) {
    fmt::print(stderr, "{}\n", e.what());
    return 1;
  }
}
