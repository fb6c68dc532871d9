// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "localtable/table.hpp"
#include "localtable/variant.hpp"

namespace localtable {

// Dense numeric array stored in row-major order
class NDArray {
  std::vector<std::int64_t> _shape{};
  NumericBuffer _data{};

 public:
  NDArray() = default;
  NDArray(std::vector<std::int64_t> shape, NumericBuffer data);

  [[nodiscard]] std::size_t rank() const noexcept;
  [[nodiscard]] const std::vector<std::int64_t> &shape() const noexcept;
  [[nodiscard]] std::int64_t num_rows() const noexcept;
  [[nodiscard]] std::int64_t num_columns() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const NumericBuffer &data() const noexcept;
};

// Throws InvalidRankError for arrays that are not 1-D or 2-D.
[[nodiscard]] LocalRelation ndarray_to_relation(const NDArray &array,
                                                const std::vector<std::string> &column_names);

}  // namespace localtable
