// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include <arrow/chunked_array.h>
#include <arrow/compute/api_scalar.h>
#include <arrow/datum.h>
#include <arrow/table.h>
#include <arrow/type.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "localtable/frame.hpp"
#include "localtable/table.hpp"

namespace localtable {

[[nodiscard]] static std::shared_ptr<arrow::ChunkedArray> unwrap_datum(
    arrow::Result<arrow::Datum> res, std::string_view label, std::string_view operation) {
  if (!res.ok()) {
    throw std::runtime_error(fmt::format(FMT_STRING("failed to {} column \"{}\": {}"), operation,
                                         label, res.status().message()));
  }
  return res.MoveValueUnsafe().chunked_array();
}

[[nodiscard]] static bool has_timezone(const arrow::DataType &type) {
  return !static_cast<const arrow::TimestampType &>(type).timezone().empty();
}

std::shared_ptr<arrow::ChunkedArray> ArrowBatchSerializer::create_array(
    const FrameColumn &column, const std::shared_ptr<arrow::DataType> &arrow_type) const {
  if (!arrow_type) {
    return column.data;
  }

  auto data = column.data;
  const auto source_type = data->type();
  if (source_type->id() == arrow::Type::TIMESTAMP && arrow_type->id() == arrow::Type::TIMESTAMP &&
      data->num_chunks() != 0) {
    internal::init_arrow_compute();
    const auto source_unit = static_cast<const arrow::TimestampType &>(*source_type).unit();
    if (!has_timezone(*source_type) && has_timezone(*arrow_type)) {
      SPDLOG_DEBUG(FMT_STRING("localizing column \"{}\" to timezone {}..."), column.label,
                   _timezone);
      data = unwrap_datum(arrow::compute::AssumeTimezone(
                              arrow::Datum{data}, arrow::compute::AssumeTimezoneOptions{_timezone}),
                          column.label, "localize");
    } else if (has_timezone(*source_type) && !has_timezone(*arrow_type)) {
      SPDLOG_DEBUG(FMT_STRING("converting column \"{}\" to wall-clock time in {}..."),
                   column.label, _timezone);
      data = cast_column(data, arrow::timestamp(source_unit, _timezone), _safecheck);
      data = unwrap_datum(arrow::compute::LocalTimestamp(arrow::Datum{data}), column.label,
                          "strip timezone from");
    }
  }

  return cast_column(data, arrow_type, _safecheck);
}

[[nodiscard]] static std::vector<std::string> positional_names(std::size_t n) {
  std::vector<std::string> names(n);
  for (std::size_t i = 0; i < n; ++i) {
    names[i] = fmt::format(FMT_STRING("_{}"), i);
  }
  return names;
}

ArrowBatchSerializer::ArrowBatchSerializer(std::string timezone, bool safecheck)
    : _timezone(std::move(timezone)), _safecheck(safecheck) {}

const std::string &ArrowBatchSerializer::timezone() const noexcept { return _timezone; }
bool ArrowBatchSerializer::safecheck() const noexcept { return _safecheck; }

std::shared_ptr<arrow::Table> ArrowBatchSerializer::create_table(
    const Frame &frame, const std::vector<std::shared_ptr<arrow::DataType>> &arrow_types) const {
  const auto num_columns = std::min(arrow_types.size(), frame.num_columns());
  const auto names = positional_names(num_columns);

  arrow::FieldVector fields{};
  arrow::ChunkedArrayVector columns{};
  fields.reserve(num_columns);
  columns.reserve(num_columns);
  for (std::size_t i = 0; i < num_columns; ++i) {
    columns.emplace_back(create_array(frame.columns()[i], arrow_types[i]));
    fields.emplace_back(arrow::field(names[i], columns.back()->type()));
  }

  return arrow::Table::Make(arrow::schema(std::move(fields)), std::move(columns),
                            frame.num_rows());
}

}  // namespace localtable
