// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <string_view>

#include "localtable/type.hpp"

namespace localtable {

// Parse a column list such as "a INT, b ARRAY<STRING> NOT NULL".
[[nodiscard]] StructType parse_table_schema(std::string_view ddl);
// Parse a single type such as "map<string,int>" or "struct<a:int>".
[[nodiscard]] DataType parse_data_type(std::string_view ddl);
// Parse ddl as a column list first and fall back to a single data type.
[[nodiscard]] DataType parse_ddl(std::string_view ddl);

}  // namespace localtable
