// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include <type_traits>

/// @brief Cast enum type to underlying integral type.
template <typename T>
constexpr auto to_integral(T e) {
  return static_cast<std::underlying_type_t<T>>(e);
}

// -------------------------------------------------------------------------------------------------
// Helpers for toString(Enum, bool withClass) implementations
#define ENUM_STRINGIFY3(ENUMCLASS, VALUE, WITHCLASS) \
  ((WITHCLASS) ? #ENUMCLASS "::" #VALUE : #VALUE)

#define ENUM_CASE_STRINGIFY3(ENUMCLASS, VALUE, WITHCLASS) \
  case ENUMCLASS::VALUE: return ENUM_STRINGIFY3(ENUMCLASS, VALUE, WITHCLASS)
