// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/py_local_relation.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "localtable/nanobind.hpp"
#include "localtable/pyarrow.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"

namespace nb = nanobind;

namespace localtable {

PyLocalRelation::PyLocalRelation(LocalRelation relation) noexcept
    : _relation(std::move(relation)) {}

const LocalRelation &PyLocalRelation::relation() const noexcept { return _relation; }

DataType PyLocalRelation::schema() const { return DataType{_relation.schema}; }

std::vector<std::string> PyLocalRelation::column_names() const {
  return _relation.column_names();
}

std::int64_t PyLocalRelation::num_rows() const noexcept { return _relation.num_rows(); }

std::int64_t PyLocalRelation::num_columns() const noexcept { return _relation.num_columns(); }

nb::object PyLocalRelation::to_arrow() const { return export_pyarrow_table(_relation.table); }

std::string PyLocalRelation::repr() const {
  return fmt::format(FMT_STRING("LocalRelation(num_rows={}, schema={})"), num_rows(),
                     DataType{_relation.schema}.simple_string());
}

void PyLocalRelation::bind(nb::module_ &m) {
  auto rel = nb::class_<PyLocalRelation>(
      m, "LocalRelation",
      "Class representing a columnar table together with the schema describing it.");

  rel.def("__repr__", &PyLocalRelation::repr, nb::rv_policy::move);

  rel.def_prop_ro("schema", &PyLocalRelation::schema, "Get the schema of the table.",
                  nb::rv_policy::move);
  rel.def_prop_ro("column_names", &PyLocalRelation::column_names,
                  "Get the names of the table columns.", nb::rv_policy::move);
  rel.def_prop_ro("num_rows", &PyLocalRelation::num_rows, "Get the number of rows.");
  rel.def_prop_ro("num_columns", &PyLocalRelation::num_columns, "Get the number of columns.");

  rel.def("to_arrow", &PyLocalRelation::to_arrow, nb::sig("def to_arrow(self) -> pyarrow.Table"),
          "Export the table as a pyarrow.Table.", nb::rv_policy::take_ownership);
}

}  // namespace localtable
