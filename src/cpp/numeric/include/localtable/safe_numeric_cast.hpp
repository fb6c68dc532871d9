// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <string_view>
#include <type_traits>

namespace localtable {

// Name of the numeric type as used in error messages, e.g. int16 or float64
template <typename N>
[[nodiscard]] constexpr std::string_view numeric_type_name() noexcept;

// Check whether an integer value can be represented by N_OUT
template <typename N_OUT, typename N_IN>
[[nodiscard]] constexpr bool fits_in(N_IN value) noexcept;

// Supported conversions:
// - integer -> integer: throws std::invalid_argument when n does not fit in N_OUT
// - integer -> floating-point and floating-point -> floating-point: never throw
// Conversions from floating-point to integer are rejected at compile time.
template <typename N_OUT, typename N_IN>
[[nodiscard]] constexpr N_OUT safe_numeric_cast(N_IN n);

// Same as above, the error message names the field being converted
template <typename N_OUT, typename N_IN>
[[nodiscard]] N_OUT safe_numeric_cast(std::string_view field_name, N_IN n);

}  // namespace localtable

#include "../../safe_numeric_cast_impl.hpp"
