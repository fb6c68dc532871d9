// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <variant>

namespace localtable {

inline TypeId DataType::id() const noexcept { return static_cast<TypeId>(_type.index()); }

inline auto DataType::get() const noexcept -> const Variant & { return _type; }

template <typename T>
inline bool DataType::is() const noexcept {
  return std::holds_alternative<T>(_type);
}

template <typename T>
inline const T &DataType::get() const {
  return std::get<T>(_type);
}

inline bool DataType::is_null() const noexcept { return is<NullType>(); }

inline bool DataType::is_numeric() const noexcept {
  return is<IntegerType>() || is<FloatType>() || is<DecimalType>();
}

inline bool DataType::is_atomic() const noexcept {
  return !is<NullType>() && !is<ArrayType>() && !is<MapType>() && !is<StructType>();
}

inline bool DataType::is_struct() const noexcept { return is<StructType>(); }

}  // namespace localtable
