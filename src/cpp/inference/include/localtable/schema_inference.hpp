// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable {

struct InferenceOptions {
  bool infer_dict_as_struct{false};
  bool infer_array_from_first_element{false};
  bool prefer_timestamp_ntz{false};
};

[[nodiscard]] DataType infer_type(const Value &value, const InferenceOptions &opts = {},
                                  std::string_view field_path = "");

// column_names is extended in place with _<k> when a positional record has more
// fields than there are names.
[[nodiscard]] StructType infer_record_schema(const Value &record,
                                             std::vector<std::string> &column_names,
                                             const InferenceOptions &opts = {});

[[nodiscard]] StructType infer_schema_from_records(const std::vector<Value> &records,
                                                   std::vector<std::string> &column_names,
                                                   const InferenceOptions &opts = {});

}  // namespace localtable
