// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <arrow/type_fwd.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "localtable/session_context.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"

namespace localtable {

// dtype family of a frame column before it was turned into arrow
enum class NativeKind : std::uint_fast8_t { DATETIME, DATETIME_TZ, TIMEDELTA, OTHER };

[[nodiscard]] NativeKind infer_native_kind(const arrow::DataType &type) noexcept;

struct FrameColumn {
  std::string label{};
  std::shared_ptr<arrow::ChunkedArray> data{};
  NativeKind kind{NativeKind::OTHER};
};

class Frame {
  std::vector<FrameColumn> _columns{};
  std::int64_t _num_rows{};

 public:
  Frame() = default;
  explicit Frame(std::vector<FrameColumn> columns, std::optional<std::int64_t> num_rows = {});
  [[nodiscard]] static Frame from_table(const arrow::Table &table);

  [[nodiscard]] std::int64_t num_rows() const noexcept;
  [[nodiscard]] std::size_t num_columns() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const std::vector<FrameColumn> &columns() const noexcept;
  [[nodiscard]] std::vector<std::string> labels() const;
};

// Turns frame columns into arrow arrays of the requested types.
class ArrowBatchSerializer {
  std::string _timezone{};
  bool _safecheck{};

 public:
  ArrowBatchSerializer(std::string timezone, bool safecheck);

  [[nodiscard]] const std::string &timezone() const noexcept;
  [[nodiscard]] bool safecheck() const noexcept;

  // A null arrow_type keeps the native type of the column.
  [[nodiscard]] std::shared_ptr<arrow::ChunkedArray> create_array(
      const FrameColumn &column, const std::shared_ptr<arrow::DataType> &arrow_type) const;

  // One column per entry of arrow_types, named _0, _1, ...
  [[nodiscard]] std::shared_ptr<arrow::Table> create_table(
      const Frame &frame, const std::vector<std::shared_ptr<arrow::DataType>> &arrow_types) const;
};

// column_names is updated in place: filled with the frame labels when empty and no schema is
// given, padded with _<k> when shorter than the frame, replaced by the field names of schema.
// Non-struct schemas are rejected.
[[nodiscard]] LocalRelation frame_to_relation(const Frame &frame,
                                              const std::optional<DataType> &schema,
                                              std::vector<std::string> &column_names,
                                              const IngestionOptions &opts);

}  // namespace localtable
