// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <arrow/type_fwd.h>

#include <memory>

#include "localtable/frame.hpp"
#include "localtable/nanobind.hpp"

namespace localtable {

[[nodiscard]] nanobind::object export_pyarrow_table(const std::shared_ptr<arrow::Table> &table);
[[nodiscard]] nanobind::object export_pyarrow_schema(const arrow::Schema &schema);

[[nodiscard]] bool is_pyarrow_table(const nanobind::handle &obj);
[[nodiscard]] bool is_pandas_dataframe(const nanobind::handle &obj);

[[nodiscard]] std::shared_ptr<arrow::Table> import_pyarrow_table(const nanobind::handle &df);

// Accepts pandas.DataFrame and pyarrow.Table objects.
// pandas.DataFrame objects are converted through pyarrow.Table.from_pandas.
[[nodiscard]] Frame import_frame(const nanobind::handle &df);

}  // namespace localtable
