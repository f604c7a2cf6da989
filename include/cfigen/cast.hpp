#pragma once

#include "cfigen/error.hpp"
#include <concepts>
#include <fmt/format.h>
#include <type_traits>
#include <utility>

namespace cfigen {

template <std::integral To, std::integral From>
inline constexpr To cast(From i)
  requires(!std::is_same_v<To, From>)
{
  if (!std::in_range<To>(i)) {
    throw precondition_error(
        fmt::format("{} does not fit in a {}-byte {} integer", i, sizeof(To),
                    std::is_signed_v<To> ? "signed" : "unsigned"));
  }
  return static_cast<To>(i);
}

template <std::integral Id> inline constexpr Id cast(Id i) { return i; }

} // namespace cfigen
