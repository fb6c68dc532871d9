// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "localtable/table.hpp"

namespace localtable {

// Validates the column count of relation against expected_num_columns (when given) and
// renames its columns and schema fields after column_names (when not empty).
[[nodiscard]] LocalRelation reconcile(LocalRelation relation,
                                      std::optional<std::int64_t> expected_num_columns = {},
                                      const std::vector<std::string> &column_names = {});

}  // namespace localtable
