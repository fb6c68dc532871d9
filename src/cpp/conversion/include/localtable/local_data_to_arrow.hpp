// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <arrow/type_fwd.h>

#include <memory>
#include <string_view>
#include <vector>

#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable {

// Builds an arrow::Table from a sequence of records, one column per field of schema.
// Records can be maps (looked up by key), objects and named rows (looked up by name), or
// lists and tuples (looked up by position).
// Timezone-naive timestamps are wall-clock times of session_timezone: they are localized when
// stored in timestamp fields, and timezone-aware values are converted to wall-clock times when
// stored in timestamp_ntz or date fields.
class LocalDataToArrowConversion {
 public:
  LocalDataToArrowConversion() = delete;

  [[nodiscard]] static std::shared_ptr<arrow::Table> convert(
      const std::vector<Value> &records, const StructType &schema,
      std::string_view session_timezone = "UTC");
};

}  // namespace localtable
