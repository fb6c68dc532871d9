// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/table.hpp"

#include <arrow/chunked_array.h>
#include <arrow/compute/cast.h>
#include <arrow/compute/initialize.h>
#include <arrow/datum.h>
#include <arrow/table.h>
#include <arrow/type.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "localtable/arrow_type.hpp"
#include "localtable/type.hpp"

namespace localtable {

std::int64_t LocalRelation::num_rows() const noexcept { return table ? table->num_rows() : 0; }

std::int64_t LocalRelation::num_columns() const noexcept {
  return table ? table->num_columns() : 0;
}

std::vector<std::string> LocalRelation::column_names() const {
  if (!table) {
    return schema.names();
  }
  return table->ColumnNames();
}

namespace internal {
void init_arrow_compute() {
  static std::once_flag flag;  // NOLINT(*-const-correctness)
  std::call_once(flag, []() {
    const auto status = arrow::compute::Initialize();
    if (!status.ok()) {
      throw std::runtime_error(status.ToString());
    }
  });
}
}  // namespace internal

std::shared_ptr<arrow::ChunkedArray> cast_column(
    const std::shared_ptr<arrow::ChunkedArray> &column,
    const std::shared_ptr<arrow::DataType> &target_type, bool safe) {
  if (column->type()->Equals(*target_type)) {
    return column;
  }
  if (column->num_chunks() == 0) {
    return std::make_shared<arrow::ChunkedArray>(arrow::ArrayVector{}, target_type);
  }

  internal::init_arrow_compute();
  SPDLOG_DEBUG(FMT_STRING("casting array from {} to {}..."), column->type()->ToString(),
               target_type->ToString());
  const auto options = safe ? arrow::compute::CastOptions::Safe(target_type)
                            : arrow::compute::CastOptions::Unsafe(target_type);
  auto res = arrow::compute::Cast(arrow::Datum{column}, options);
  if (!res.ok()) {
    throw std::runtime_error(
        fmt::format(FMT_STRING("failed to cast array of type {} to type {}: {}"),
                    column->type()->ToString(), target_type->ToString(), res.status().message()));
  }
  return res.ValueUnsafe().chunked_array();
}

std::shared_ptr<arrow::Table> cast_table(const std::shared_ptr<arrow::Table> &table,
                                         const std::shared_ptr<arrow::Schema> &schema, bool safe) {
  if (table->num_columns() != schema->num_fields()) {
    throw std::runtime_error(
        fmt::format(FMT_STRING("unable to cast table with {} column(s) to a schema with {} "
                               "field(s)"),
                    table->num_columns(), schema->num_fields()));
  }

  arrow::ChunkedArrayVector columns{};
  columns.reserve(static_cast<std::size_t>(table->num_columns()));
  for (int i = 0; i < table->num_columns(); ++i) {
    columns.emplace_back(cast_column(table->column(i), schema->field(i)->type(), safe));
  }
  return arrow::Table::Make(schema, std::move(columns), table->num_rows());
}

std::shared_ptr<arrow::Table> rename_columns(const std::shared_ptr<arrow::Table> &table,
                                             const std::vector<std::string> &names) {
  auto res = table->RenameColumns(names);
  if (!res.ok()) {
    throw std::runtime_error(fmt::format(FMT_STRING("failed to rename table columns: {}"),
                                         res.status().message()));
  }
  return res.MoveValueUnsafe();
}

LocalRelation make_empty_relation(const StructType &schema) {
  auto res = arrow::Table::MakeEmpty(to_arrow_schema(schema));
  if (!res.ok()) {
    throw std::runtime_error(
        fmt::format(FMT_STRING("failed to create an empty table: {}"), res.status().message()));
  }
  return {res.MoveValueUnsafe(), schema};
}

}  // namespace localtable
