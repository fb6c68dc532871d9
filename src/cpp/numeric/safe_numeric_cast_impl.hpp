// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace localtable {

template <typename N>
constexpr std::string_view numeric_type_name() noexcept {
  static_assert(std::is_arithmetic_v<N>);
  // NOLINTBEGIN(*-avoid-magic-numbers)
  if constexpr (std::is_same_v<N, bool>) {
    return "bool";
  } else if constexpr (std::is_floating_point_v<N>) {
    return sizeof(N) == 4 ? "float32" : "float64";
  } else if constexpr (std::is_signed_v<N>) {
    constexpr std::string_view names[]{"int8", "int16", "", "int32", "", "", "", "int64"};
    return names[sizeof(N) - 1];
  } else {
    constexpr std::string_view names[]{"uint8", "uint16", "", "uint32", "", "", "", "uint64"};
    return names[sizeof(N) - 1];
  }
  // NOLINTEND(*-avoid-magic-numbers)
}

template <typename N_OUT, typename N_IN>
constexpr bool fits_in(N_IN value) noexcept {
  static_assert(std::is_integral_v<N_OUT> && std::is_integral_v<N_IN>);
  constexpr auto max_out = std::numeric_limits<N_OUT>::max();

  if constexpr (std::is_signed_v<N_IN> == std::is_signed_v<N_OUT>) {
    return value >= std::numeric_limits<N_OUT>::lowest() && value <= max_out;
  } else if constexpr (std::is_signed_v<N_IN>) {
    return value >= 0 && static_cast<std::uint64_t>(value) <= static_cast<std::uint64_t>(max_out);
  } else {
    return static_cast<std::uint64_t>(value) <= static_cast<std::uint64_t>(max_out);
  }
}

template <typename N_OUT, typename N_IN>
constexpr N_OUT safe_numeric_cast(N_IN n) {
  static_assert(std::is_arithmetic_v<N_OUT> && std::is_arithmetic_v<N_IN>);
  static_assert(std::is_floating_point_v<N_OUT> || std::is_integral_v<N_IN>,
                "floating-point to integer conversions are not supported");

  if constexpr (std::is_integral_v<N_OUT>) {
    if (!fits_in<N_OUT>(n)) {
      throw std::invalid_argument(fmt::format(FMT_STRING("{} ({}) does not fit in {}"), n,
                                              numeric_type_name<N_IN>(),
                                              numeric_type_name<N_OUT>()));
    }
  }
  return static_cast<N_OUT>(n);
}

template <typename N_OUT, typename N_IN>
N_OUT safe_numeric_cast(std::string_view field_name, N_IN n) {
  try {
    return safe_numeric_cast<N_OUT>(n);
  } catch (const std::invalid_argument &e) {
    throw std::invalid_argument(fmt::format(FMT_STRING("{}: {}"), field_name, e.what()));
  }
}

}  // namespace localtable
