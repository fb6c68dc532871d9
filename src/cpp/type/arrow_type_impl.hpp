// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <arrow/type_fwd.h>

namespace localtable {

constexpr bool is_dictionary_dtype(arrow::Type::type type) noexcept {
  return type == arrow::Type::DICTIONARY;
}

constexpr bool is_string_dtype(arrow::Type::type type) noexcept {
  using T = decltype(type);
  return type == T::STRING || type == T::STRING_VIEW || type == T::LARGE_STRING;
}

constexpr bool is_binary_dtype(arrow::Type::type type) noexcept {
  using T = decltype(type);
  return type == T::BINARY || type == T::BINARY_VIEW || type == T::LARGE_BINARY ||
         type == T::FIXED_SIZE_BINARY;
}

constexpr bool is_unsigned_dtype(arrow::Type::type type) noexcept {
  using T = decltype(type);
  return type == T::UINT8 || type == T::UINT16 || type == T::UINT32 || type == T::UINT64;
}

constexpr bool is_integral_dtype(arrow::Type::type type) noexcept {
  switch (type) {
    using T = decltype(type);
    case T::INT8:
      [[fallthrough]];
    case T::INT16:
      [[fallthrough]];
    case T::INT32:
      [[fallthrough]];
    case T::INT64:
      return true;
    default:
      return is_unsigned_dtype(type);
  }
}

constexpr bool is_floating_point_dtype(arrow::Type::type type) noexcept {
  using T = decltype(type);
  return type == T::HALF_FLOAT || type == T::FLOAT || type == T::DOUBLE;
}

constexpr bool is_numeric_dtype(arrow::Type::type type) noexcept {
  return is_integral_dtype(type) || is_floating_point_dtype(type);
}

constexpr bool is_temporal_dtype(arrow::Type::type type) noexcept {
  using T = decltype(type);
  return type == T::TIMESTAMP || type == T::DURATION || type == T::DATE32 || type == T::DATE64;
}

}  // namespace localtable
