#pragma once

#include "cfigen/error.hpp"
#include <fmt/core.h>

#define CFIGEN_REQUIRE(cond)                                                   \
  do {                                                                         \
    if (!(cond))                                                               \
      throw ::cfigen::precondition_error(                                      \
          fmt::format("Assertion \"{}\" failed at {}:{}", #cond, __FILE__,     \
                      __LINE__));                                              \
  } while (0)

#define CFIGEN_THROW_IF(cond, type, ...)                                       \
  do {                                                                         \
    if (cond)                                                                  \
      throw type(fmt::format(__VA_ARGS__));                                    \
  } while (0)
