// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/py_data_type.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <vector>

#include "localtable/arrow_type.hpp"
#include "localtable/ddl.hpp"
#include "localtable/nanobind.hpp"
#include "localtable/pyarrow.hpp"
#include "localtable/type.hpp"

namespace nb = nanobind;

namespace localtable {

[[nodiscard]] static std::string data_type_repr(const DataType &type) {
  return fmt::format(FMT_STRING("DataType(\"{}\")"), type.simple_string());
}

[[nodiscard]] static bool data_type_eq(const DataType &self, nb::handle other) {
  return nb::isinstance<DataType>(other) && self == nb::cast<const DataType &>(other);
}

[[nodiscard]] static std::vector<std::string> data_type_field_names(const DataType &type) {
  if (!type.is_struct()) {
    return {};
  }
  return type.get<StructType>().names();
}

[[nodiscard]] static nb::object data_type_to_arrow_schema(const DataType &type) {
  return export_pyarrow_schema(*to_arrow_schema(as_struct(type)));
}

void bind_data_type(nb::module_ &m) {
  auto dtype = nb::class_<DataType>(m, "DataType", "Class representing a column or table type.");

  dtype.def("__repr__", &data_type_repr, nb::rv_policy::move);
  dtype.def("__str__", &DataType::simple_string, nb::rv_policy::move);
  dtype.def("__eq__", &data_type_eq, nb::arg("other"));
  dtype.def(
      "__ne__", [](const DataType &self, nb::handle other) { return !data_type_eq(self, other); },
      nb::arg("other"));

  dtype.def("simple_string", &DataType::simple_string,
            "Get the canonical DDL-like representation of the type.", nb::rv_policy::move);
  dtype.def("sql", &DataType::sql, "Get the SQL representation of the type.",
            nb::rv_policy::move);
  dtype.def("is_struct", &DataType::is_struct, "Check whether the type is a struct.");
  dtype.def("field_names", &data_type_field_names,
            "Get the names of the struct fields. Returns an empty list for non-struct types.",
            nb::rv_policy::move);
  dtype.def("to_arrow_schema", &data_type_to_arrow_schema,
            nb::sig("def to_arrow_schema(self) -> pyarrow.Schema"),
            "Get the arrow schema used to encode tables with the given type. Non-struct types "
            "are wrapped in a single field named \"value\".",
            nb::rv_policy::take_ownership);

  m.def(
      "parse_ddl", [](std::string_view ddl) { return parse_ddl(ddl); }, nb::arg("ddl"),
      "Parse a DDL string such as \"a INT, b STRING\" or \"array<double>\" into a DataType.",
      nb::rv_policy::move);
}

}  // namespace localtable
