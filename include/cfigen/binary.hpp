#pragma once

#include "cfigen/error.hpp"
#include "cfigen/macros.hpp"
#include <concepts>
#include <cstdint>
#include <cstring>
#include <fmt/core.h>
#include <llvm/Support/LEB128.h>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cfigen {

template <typename T>
concept trivially_copyable = std::is_trivially_copyable_v<T>;

struct Reader {
  const uint8_t *begin{}, *end{};
  size_t bytes_read = 0;
  Reader(std::span<const uint8_t> buffer_view, size_t pos = 0)
      : begin(buffer_view.data()),
        end(buffer_view.data() + buffer_view.size()), bytes_read(pos) {}

  Reader subspan(uint64_t len) const {
    CFIGEN_THROW_IF(len > size(), read_error,
                    "entry of {} bytes at {:#x} runs past the end", len,
                    bytes_read);
    return Reader(std::span(begin, len), bytes_read);
  }

  size_t size() const noexcept { return end - begin; }

  template <trivially_copyable T> T consume() {
    T result = view<T>();
    increment(sizeof(T));
    return result;
  }

  template <trivially_copyable T> T view() const {
    CFIGEN_THROW_IF(sizeof(T) > size(), read_error,
                    "{}-byte read at {:#x} runs past the end", sizeof(T),
                    bytes_read);
    T result;
    std::memcpy(&result, begin, sizeof(T));
    return result;
  }

  std::string_view consume_cstr() {
    auto n = std::memchr(begin, '\0', size());
    CFIGEN_THROW_IF(!n, read_error, "unterminated string at {:#x}",
                    bytes_read);
    auto result = std::string_view(reinterpret_cast<const char *>(begin),
                                   static_cast<const uint8_t *>(n) - begin);
    increment(result.size() + 1);
    return result;
  }

  uint64_t consume_uleb() {
    unsigned n = 0;
    const char *err = nullptr;
    auto result = llvm::decodeULEB128(begin, &n, end, &err);
    CFIGEN_THROW_IF(err, read_error, "at {:#x}: {}", bytes_read, err);
    increment(n);
    return result;
  }

  int64_t consume_sleb() {
    unsigned n = 0;
    const char *err = nullptr;
    auto result = llvm::decodeSLEB128(begin, &n, end, &err);
    CFIGEN_THROW_IF(err, read_error, "at {:#x}: {}", bytes_read, err);
    increment(n);
    return result;
  }

  void increment(uint64_t len) {
    CFIGEN_THROW_IF(len > size(), read_error, "incremented out of range");
    begin += len;
    bytes_read += len;
  }

  bool empty() const noexcept { return begin >= end; }
};

// Appends to a byte buffer. Fields written with a placeholder can be patched
// once their value is known.
struct Writer {
  std::vector<uint8_t> &buffer;
  explicit Writer(std::vector<uint8_t> &b) : buffer(b) {}

  size_t bytes_written() const noexcept { return buffer.size(); }

  void write_bytes(std::span<const uint8_t> data) {
    buffer.insert(buffer.end(), data.begin(), data.end());
  }

  template <trivially_copyable T> void write(T const &data) {
    auto pos = buffer.size();
    buffer.resize(pos + sizeof(T));
    std::memcpy(buffer.data() + pos, &data, sizeof(T));
  }

  void write_uleb(uint64_t value) {
    uint8_t encoded[16];
    auto n = llvm::encodeULEB128(value, encoded);
    write_bytes(std::span(encoded, n));
  }

  void write_sleb(int64_t value) {
    uint8_t encoded[16];
    auto n = llvm::encodeSLEB128(value, encoded);
    write_bytes(std::span(encoded, n));
  }

  template <trivially_copyable T> void patch(size_t offset, T const &data) {
    CFIGEN_REQUIRE(offset + sizeof(T) <= buffer.size());
    std::memcpy(buffer.data() + offset, &data, sizeof(T));
  }
};

} // namespace cfigen
