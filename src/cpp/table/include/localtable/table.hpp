// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <arrow/type_fwd.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "localtable/type.hpp"

namespace localtable {

// The product of the ingestion pipeline: a columnar table and the schema describing it.
struct LocalRelation {
  std::shared_ptr<arrow::Table> table{};
  StructType schema{};

  [[nodiscard]] std::int64_t num_rows() const noexcept;
  [[nodiscard]] std::int64_t num_columns() const noexcept;
  [[nodiscard]] std::vector<std::string> column_names() const;
};

namespace internal {
void init_arrow_compute();
}  // namespace internal

[[nodiscard]] std::shared_ptr<arrow::ChunkedArray> cast_column(
    const std::shared_ptr<arrow::ChunkedArray> &column,
    const std::shared_ptr<arrow::DataType> &target_type, bool safe = true);

// Cast every column of table to the type of the matching field of schema.
// Columns are also renamed after the fields of schema.
[[nodiscard]] std::shared_ptr<arrow::Table> cast_table(const std::shared_ptr<arrow::Table> &table,
                                                       const std::shared_ptr<arrow::Schema> &schema,
                                                       bool safe = true);

[[nodiscard]] std::shared_ptr<arrow::Table> rename_columns(
    const std::shared_ptr<arrow::Table> &table, const std::vector<std::string> &names);

[[nodiscard]] LocalRelation make_empty_relation(const StructType &schema);

}  // namespace localtable
