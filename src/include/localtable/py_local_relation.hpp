// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "localtable/nanobind.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"

namespace localtable {

class PyLocalRelation {
  LocalRelation _relation{};

 public:
  PyLocalRelation() = default;
  explicit PyLocalRelation(LocalRelation relation) noexcept;

  [[nodiscard]] const LocalRelation &relation() const noexcept;

  [[nodiscard]] DataType schema() const;
  [[nodiscard]] std::vector<std::string> column_names() const;
  [[nodiscard]] std::int64_t num_rows() const noexcept;
  [[nodiscard]] std::int64_t num_columns() const noexcept;

  [[nodiscard]] nanobind::object to_arrow() const;
  [[nodiscard]] std::string repr() const;

  static void bind(nanobind::module_ &m);
};

}  // namespace localtable
