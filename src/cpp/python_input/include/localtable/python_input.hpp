// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <map>
#include <optional>
#include <string>

#include "localtable/create_table.hpp"
#include "localtable/nanobind.hpp"
#include "localtable/ndarray.hpp"
#include "localtable/session_context.hpp"
#include "localtable/value.hpp"

namespace localtable {

// All functions declared here must be called while holding the GIL.

[[nodiscard]] Value import_value(const nanobind::handle &obj);

[[nodiscard]] NDArray import_ndarray(const nanobind::handle &array);

// Classifies data as a relation handle, a frame, a numpy array or an iterable of records.
[[nodiscard]] LocalData import_local_data(const nanobind::handle &data);

// Accepts None, DataType, DDL strings and lists or tuples of column names.
[[nodiscard]] SchemaArg import_schema_arg(const nanobind::handle &schema);

[[nodiscard]] StaticSessionContext make_session_context(
    const std::optional<std::map<std::string, std::string>> &conf);

}  // namespace localtable
