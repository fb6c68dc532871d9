// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/ndarray.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/table.h>
#include <arrow/type.h>
#include <arrow/type_traits.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/arrow_type.hpp"
#include "localtable/errors.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"
#include "localtable/variant.hpp"

namespace localtable {

[[nodiscard]] static std::size_t buffer_size(const NumericBuffer &buff) noexcept {
  return std::visit([](const auto &v) { return v.size(); }, buff);
}

NDArray::NDArray(std::vector<std::int64_t> shape, NumericBuffer data)
    : _shape(std::move(shape)), _data(std::move(data)) {
  const auto expected_size = std::accumulate(_shape.begin(), _shape.end(), std::int64_t{1},
                                             std::multiplies<std::int64_t>{});
  if (expected_size < 0 || static_cast<std::size_t>(expected_size) != buffer_size(_data)) {
    throw std::invalid_argument(
        fmt::format(FMT_STRING("array of shape ({}) cannot hold {} element(s)"),
                    fmt::join(_shape, ", "), buffer_size(_data)));
  }
}

std::size_t NDArray::rank() const noexcept { return _shape.size(); }
const std::vector<std::int64_t> &NDArray::shape() const noexcept { return _shape; }

std::int64_t NDArray::num_rows() const noexcept { return _shape.empty() ? 0 : _shape.front(); }

std::int64_t NDArray::num_columns() const noexcept {
  if (_shape.size() < 2) {
    return 1;
  }
  return _shape[1];
}

bool NDArray::empty() const noexcept { return num_rows() == 0; }
const NumericBuffer &NDArray::data() const noexcept { return _data; }

template <typename T>
[[nodiscard]] static std::shared_ptr<arrow::Array> make_column(const std::vector<T> &data,
                                                               std::int64_t num_rows,
                                                               std::int64_t num_columns,
                                                               std::int64_t column) {
  using ArrowType = typename arrow::CTypeTraits<T>::ArrowType;
  arrow::NumericBuilder<ArrowType> builder{};

  auto check_status = [&](const arrow::Status &status) {
    if (!status.ok()) {
      throw std::runtime_error(fmt::format(FMT_STRING("failed to build column {} of array: {}"),
                                           column, status.message()));
    }
  };

  check_status(builder.Reserve(num_rows));
  for (std::int64_t i = 0; i < num_rows; ++i) {
    builder.UnsafeAppend(data[static_cast<std::size_t>(i * num_columns + column)]);
  }

  std::shared_ptr<arrow::Array> array{};
  check_status(builder.Finish(&array));
  return array;
}

[[nodiscard]] static std::vector<std::string> default_column_names(const NDArray &array) {
  const auto num_columns = array.num_columns();
  if (array.rank() == 1 || num_columns == 1) {
    return {"value"};
  }

  std::vector<std::string> names(static_cast<std::size_t>(num_columns));
  for (std::size_t i = 0; i < names.size(); ++i) {
    names[i] = fmt::format(FMT_STRING("_{}"), i + 1);
  }
  return names;
}

LocalRelation ndarray_to_relation(const NDArray &array,
                                  const std::vector<std::string> &column_names) {
  if (array.rank() != 1 && array.rank() != 2) {
    throw InvalidRankError(static_cast<std::int64_t>(array.rank()));
  }

  const auto num_rows = array.num_rows();
  const auto num_columns = array.num_columns();
  const auto names = column_names.empty() ? default_column_names(array) : column_names;
  if (static_cast<std::int64_t>(names.size()) != num_columns) {
    throw AxisLengthMismatchError(static_cast<std::int64_t>(names.size()), num_columns);
  }

  SPDLOG_DEBUG(FMT_STRING("converting array of shape ({}) to an arrow::Table..."),
               fmt::join(array.shape(), ", "));

  arrow::ArrayVector columns{};
  StructType schema{};
  columns.reserve(static_cast<std::size_t>(num_columns));
  for (std::int64_t i = 0; i < num_columns; ++i) {
    columns.emplace_back(std::visit(
        [&](const auto &data) { return make_column(data, num_rows, num_columns, i); },
        array.data()));
    schema.add(names[static_cast<std::size_t>(i)], from_arrow_type(columns.back()->type()), true);
  }

  arrow::FieldVector fields{};
  fields.reserve(columns.size());
  for (std::size_t i = 0; i < columns.size(); ++i) {
    fields.emplace_back(arrow::field(names[i], columns[i]->type()));
  }

  auto table = arrow::Table::Make(arrow::schema(std::move(fields)), columns, num_rows);
  return {cast_table(table, to_arrow_schema(schema)), schema};
}

}  // namespace localtable
