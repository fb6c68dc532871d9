// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/frame.hpp"

#include <arrow/chunked_array.h>
#include <arrow/table.h>
#include <arrow/type.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "localtable/arrow_type.hpp"
#include "localtable/errors.hpp"
#include "localtable/session_context.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"

namespace localtable {

NativeKind infer_native_kind(const arrow::DataType &type) noexcept {
  if (type.id() == arrow::Type::TIMESTAMP) {
    const auto &dtype = static_cast<const arrow::TimestampType &>(type);
    return dtype.timezone().empty() ? NativeKind::DATETIME : NativeKind::DATETIME_TZ;
  }
  if (type.id() == arrow::Type::DURATION) {
    return NativeKind::TIMEDELTA;
  }
  return NativeKind::OTHER;
}

Frame::Frame(std::vector<FrameColumn> columns, std::optional<std::int64_t> num_rows)
    : _columns(std::move(columns)) {
  if (num_rows.has_value()) {
    _num_rows = *num_rows;
  } else if (!_columns.empty()) {
    _num_rows = _columns.front().data->length();
  }

  for (const auto &col : _columns) {
    if (!col.data) {
      throw std::invalid_argument(
          fmt::format(FMT_STRING("column \"{}\" does not have any data"), col.label));
    }
    if (col.data->length() != _num_rows) {
      throw std::invalid_argument(
          fmt::format(FMT_STRING("column \"{}\" has {} rows, expected {}"), col.label,
                      col.data->length(), _num_rows));
    }
  }
}

Frame Frame::from_table(const arrow::Table &table) {
  std::vector<FrameColumn> columns{};
  columns.reserve(static_cast<std::size_t>(table.num_columns()));
  for (int i = 0; i < table.num_columns(); ++i) {
    const auto &field = table.schema()->field(i);
    columns.emplace_back(
        FrameColumn{field->name(), table.column(i), infer_native_kind(*field->type())});
  }
  return Frame{std::move(columns), table.num_rows()};
}

std::int64_t Frame::num_rows() const noexcept { return _num_rows; }
std::size_t Frame::num_columns() const noexcept { return _columns.size(); }
bool Frame::empty() const noexcept { return _num_rows == 0; }
const std::vector<FrameColumn> &Frame::columns() const noexcept { return _columns; }

std::vector<std::string> Frame::labels() const {
  std::vector<std::string> labels_(_columns.size());
  std::transform(_columns.begin(), _columns.end(), labels_.begin(),
                 [](const FrameColumn &col) { return col.label; });
  return labels_;
}

[[nodiscard]] static std::shared_ptr<arrow::DataType> native_target_type(NativeKind kind) {
  switch (kind) {
    case NativeKind::DATETIME:
      [[fallthrough]];
    case NativeKind::DATETIME_TZ:
      return to_arrow_type(TimestampType{false});
    case NativeKind::TIMEDELTA:
      return to_arrow_type(DayTimeIntervalType{});
    case NativeKind::OTHER:
      return nullptr;
  }
  return nullptr;
}

[[nodiscard]] static LocalRelation frame_with_schema(const Frame &frame, const StructType &schema,
                                                     const ArrowBatchSerializer &serializer) {
  if (schema.size() > frame.num_columns()) {
    throw AxisLengthMismatchError(static_cast<std::int64_t>(schema.size()),
                                  static_cast<std::int64_t>(frame.num_columns()));
  }

  const auto deduped_schema = deduplicate_field_names(schema);
  const auto arrow_schema = to_arrow_schema(deduped_schema);

  std::vector<std::shared_ptr<arrow::DataType>> arrow_types{};
  arrow_types.reserve(schema.size());
  for (const auto &field : arrow_schema->fields()) {
    arrow_types.emplace_back(field->type());
  }

  auto table = serializer.create_table(frame, arrow_types);
  table = rename_columns(table, deduped_schema.names());
  return {cast_table(table, arrow_schema, serializer.safecheck()), schema};
}

[[nodiscard]] static LocalRelation frame_without_schema(const Frame &frame,
                                                        const std::vector<std::string> &names,
                                                        const ArrowBatchSerializer &serializer) {
  std::vector<std::shared_ptr<arrow::DataType>> arrow_types(frame.num_columns());
  std::transform(frame.columns().begin(), frame.columns().end(), arrow_types.begin(),
                 [](const FrameColumn &col) { return native_target_type(col.kind); });

  auto table = serializer.create_table(frame, arrow_types);

  StructType schema{};
  for (std::size_t i = 0; i < frame.num_columns(); ++i) {
    const auto &label = i < names.size() ? names[i] : frame.columns()[i].label;
    schema.add(label, from_arrow_type(table->column(static_cast<int>(i))->type()), true);
  }
  table = rename_columns(table, schema.names());
  return {cast_table(table, to_arrow_schema(schema), serializer.safecheck()), schema};
}

LocalRelation frame_to_relation(const Frame &frame, const std::optional<DataType> &schema,
                                std::vector<std::string> &column_names,
                                const IngestionOptions &opts) {
  SPDLOG_DEBUG(FMT_STRING("converting frame with {} column(s) and {} row(s)..."),
               frame.num_columns(), frame.num_rows());
  const ArrowBatchSerializer serializer{opts.session_timezone, opts.safe_array_cast};

  if (schema.has_value()) {
    if (!schema->is_struct()) {
      throw UnsupportedTypeForEncodingError(schema->simple_string());
    }
    const auto &struct_schema = schema->get<StructType>();
    column_names = struct_schema.names();
    return frame_with_schema(frame, struct_schema, serializer);
  }

  if (column_names.empty()) {
    column_names = frame.labels();
  } else if (column_names.size() < frame.num_columns()) {
    for (auto i = column_names.size(); i < frame.num_columns(); ++i) {
      column_names.emplace_back(fmt::format(FMT_STRING("_{}"), i + 1));
    }
  }

  return frame_without_schema(frame, column_names, serializer);
}

}  // namespace localtable
