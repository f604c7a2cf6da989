#pragma once

#include "cfigen/call_frame.hpp"
#include "cfigen/error.hpp"
#include "cfigen/frame_layout.hpp"
#include "cfigen/isa.hpp"
#include "cfigen/relocation.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace cfigen {

std::string to_string(call_frame_instruction const &inst);
std::string to_string(frame_layout_command const &cmd);
std::string to_string(relocation_target const &target);
std::string_view to_string(libcall call) noexcept;
std::string_view to_string(compile_stage stage) noexcept;
std::string_view to_string(call_conv conv) noexcept;

namespace detail {
template <typename T> struct string_formatter : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(T const &value, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(cfigen::to_string(value),
                                                    ctx);
  }
};
} // namespace detail

} // namespace cfigen

template <>
struct fmt::formatter<cfigen::call_frame_instruction>
    : cfigen::detail::string_formatter<cfigen::call_frame_instruction> {};
template <>
struct fmt::formatter<cfigen::frame_layout_command>
    : cfigen::detail::string_formatter<cfigen::frame_layout_command> {};
template <>
struct fmt::formatter<cfigen::relocation_target>
    : cfigen::detail::string_formatter<cfigen::relocation_target> {};
template <>
struct fmt::formatter<cfigen::compile_stage>
    : cfigen::detail::string_formatter<cfigen::compile_stage> {};
template <>
struct fmt::formatter<cfigen::call_conv>
    : cfigen::detail::string_formatter<cfigen::call_conv> {};
