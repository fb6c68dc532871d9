// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <arrow/type_fwd.h>

#include <memory>

#include "localtable/type.hpp"

namespace localtable {

[[nodiscard]] std::shared_ptr<arrow::DataType> to_arrow_type(const DataType &type);
[[nodiscard]] std::shared_ptr<arrow::Field> to_arrow_field(const StructField &field);
[[nodiscard]] std::shared_ptr<arrow::Schema> to_arrow_schema(const StructType &schema);

[[nodiscard]] DataType from_arrow_type(const std::shared_ptr<arrow::DataType> &type);
[[nodiscard]] StructType from_arrow_schema(const arrow::Schema &schema);

[[nodiscard]] constexpr bool is_dictionary_dtype(arrow::Type::type type) noexcept;
[[nodiscard]] constexpr bool is_string_dtype(arrow::Type::type type) noexcept;
[[nodiscard]] constexpr bool is_binary_dtype(arrow::Type::type type) noexcept;
[[nodiscard]] constexpr bool is_integral_dtype(arrow::Type::type type) noexcept;
[[nodiscard]] constexpr bool is_unsigned_dtype(arrow::Type::type type) noexcept;
[[nodiscard]] constexpr bool is_floating_point_dtype(arrow::Type::type type) noexcept;
[[nodiscard]] constexpr bool is_numeric_dtype(arrow::Type::type type) noexcept;
[[nodiscard]] constexpr bool is_temporal_dtype(arrow::Type::type type) noexcept;

}  // namespace localtable

#include "../../arrow_type_impl.hpp"
