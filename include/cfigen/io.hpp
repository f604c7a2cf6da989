#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fmt/core.h>
#include <scope_guard.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace cfigen {

inline std::vector<uint8_t> read_file(std::string const &path) {
  auto f = std::fopen(path.c_str(), "rb");
  if (!f) {
    throw std::runtime_error(
        fmt::format("failed to open {}: {}", path, std::strerror(errno)));
  }
  auto guard = sg::make_scope_guard([&]() noexcept { std::fclose(f); });

  if (std::fseek(f, 0, SEEK_END) != 0) {
    throw std::runtime_error(fmt::format("failed to fseek {}", path));
  }
  long size = std::ftell(f);
  if (size < 0) {
    throw std::runtime_error(fmt::format("failed to ftell {}", path));
  }
  std::rewind(f);

  std::vector<uint8_t> result(static_cast<size_t>(size));
  if (std::fread(result.data(), 1, result.size(), f) != result.size()) {
    throw std::runtime_error(fmt::format("short read from {}", path));
  }
  return result;
}

} // namespace cfigen
