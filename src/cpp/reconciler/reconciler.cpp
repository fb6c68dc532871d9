// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/reconciler.hpp"

#include <arrow/table.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "localtable/errors.hpp"
#include "localtable/table.hpp"

namespace localtable {

LocalRelation reconcile(LocalRelation relation, std::optional<std::int64_t> expected_num_columns,
                        const std::vector<std::string> &column_names) {
  assert(relation.table);
  const auto num_columns = relation.table->num_columns();
  if (expected_num_columns.has_value() && *expected_num_columns != num_columns) {
    throw AxisLengthMismatchError(*expected_num_columns, num_columns);
  }

  if (column_names.empty()) {
    return relation;
  }
  if (static_cast<std::int64_t>(column_names.size()) != num_columns) {
    throw AxisLengthMismatchError(static_cast<std::int64_t>(column_names.size()), num_columns);
  }

  if (relation.table->ColumnNames() != column_names) {
    SPDLOG_DEBUG(FMT_STRING("renaming columns to [{}]"), fmt::join(column_names, ", "));
    relation.table = rename_columns(relation.table, column_names);
  }
  if (relation.schema.names() != column_names) {
    relation.schema = relation.schema.rename(column_names);
  }
  return relation;
}

}  // namespace localtable
