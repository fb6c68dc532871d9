// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/pyarrow.hpp"

#include <arrow/c/abi.h>
#include <arrow/c/bridge.h>
#include <arrow/record_batch.h>
#include <arrow/table.h>
#include <arrow/type.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "localtable/frame.hpp"
#include "localtable/nanobind.hpp"

namespace nb = nanobind;

template <>
struct std::default_delete<ArrowSchema> {
  void operator()(ArrowSchema* schema) const noexcept {
    if (schema->release) {
      schema->release(schema);
    }
    delete schema;  // NOLINT(*-owning-memory)
  }
};

template <>
struct std::default_delete<ArrowArrayStream> {
  void operator()(ArrowArrayStream* stream) const noexcept {
    if (stream->release) {
      stream->release(stream);
    }
    delete stream;  // NOLINT(*-owning-memory)
  }
};

namespace localtable {

// https://arrow.apache.org/docs/format/CDataInterface/PyCapsuleInterface.html
namespace {

template <typename T>
[[nodiscard]] T unwrap_result(arrow::Result<T> res, std::string_view what) {
  if (!res.ok()) {
    throw std::runtime_error(
        fmt::format(FMT_STRING("failed to {}: {}"), what, res.status().message()));
  }
  return res.MoveValueUnsafe();
}

void check_status(const arrow::Status& status, std::string_view what) {
  if (!status.ok()) {
    throw std::runtime_error(fmt::format(FMT_STRING("failed to {}: {}"), what, status.message()));
  }
}

// Python object exposing one of the __arrow_c_*__ protocol methods.
// The GIL must be held.
[[nodiscard]] nb::object make_capsule_provider(const char* protocol_method, nb::capsule capsule) {
  auto provider = nb::module_::import_("types").attr("SimpleNamespace")();
  auto method = [capsule_ = std::move(capsule)]([[maybe_unused]] const nb::args& args,
                                               [[maybe_unused]] const nb::kwargs& kwargs) {
    return capsule_;
  };
  nb::setattr(provider, protocol_method, nb::cpp_function(std::move(method)));
  return provider;
}

// The capsule owns the C struct: keep it alive until its content has been imported.
// The GIL must be held.
[[nodiscard]] nb::capsule call_capsule_protocol(const nb::handle& obj, const char* protocol_method,
                                                std::string_view capsule_name) {
  if (!nb::hasattr(obj, protocol_method)) {
    throw std::invalid_argument(
        fmt::format(FMT_STRING("object of type {} does not implement {}"),
                    format_py_type(obj.type()), protocol_method));
  }

  auto capsule = nb::cast<nb::capsule>(obj.attr(protocol_method)());
  if (capsule.name() != capsule_name) {
    throw std::runtime_error(
        fmt::format(FMT_STRING("{}() returned a capsule named {}, expected {}"), protocol_method,
                    capsule.name(), capsule_name));
  }
  return capsule;
}

}  // namespace

nb::object export_pyarrow_schema(const arrow::Schema& schema) {
  auto c_schema = std::make_unique<ArrowSchema>();
  check_status(arrow::ExportSchema(schema, c_schema.get()), "export arrow::Schema");

  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  const auto pa = import_pyarrow_checked();
  auto capsule = make_capsule(std::move(c_schema), "arrow_schema");
  return pa.attr("schema")(make_capsule_provider("__arrow_c_schema__", std::move(capsule)));
}

nb::object export_pyarrow_table(const std::shared_ptr<arrow::Table>& table) {
  if (!table) {
    throw std::runtime_error("export_pyarrow_table(): table is null");
  }

  auto reader = std::make_shared<arrow::TableBatchReader>(table);
  auto c_stream = std::make_unique<ArrowArrayStream>();
  check_status(arrow::ExportRecordBatchReader(std::move(reader), c_stream.get()),
               "export arrow::Table");

  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  const auto pa = import_pyarrow_checked();
  SPDLOG_DEBUG(FMT_STRING("exporting table with {} row(s) to pyarrow..."), table->num_rows());
  auto capsule = make_capsule(std::move(c_stream), "arrow_array_stream");
  return pa.attr("table")(make_capsule_provider("__arrow_c_stream__", std::move(capsule)));
}

std::shared_ptr<arrow::Table> import_pyarrow_table(const nb::handle& table) {
  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  const auto capsule = call_capsule_protocol(table, "__arrow_c_stream__", "arrow_array_stream");
  const auto reader =
      unwrap_result(arrow::ImportRecordBatchReader(static_cast<ArrowArrayStream*>(capsule.data())),
                    "import arrow stream");
  const auto num_rows = nb::cast<std::int64_t>(table.attr("num_rows"));

  auto arrow_table = unwrap_result(reader->ToTable(), "read arrow stream");
  if (arrow_table->num_columns() == 0) {
    return arrow::Table::Make(arrow_table->schema(), arrow::ChunkedArrayVector{}, num_rows);
  }
  return arrow_table;
}

// obj can only be an instance of module_name.type_name if the module was already imported
[[nodiscard]] static bool is_instance_of(const nb::handle& obj, const char* module_name,
                                         const char* type_name) {
  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  const auto mod = nb::module_::import_("sys").attr("modules").attr("get")(module_name);
  if (mod.is_none()) {
    return false;
  }
  return nb::isinstance(obj, mod.attr(type_name));
}

bool is_pyarrow_table(const nb::handle& obj) { return is_instance_of(obj, "pyarrow", "Table"); }

bool is_pandas_dataframe(const nb::handle& obj) {
  return is_instance_of(obj, "pandas", "DataFrame");
}

[[nodiscard]] static Frame import_pandas_dataframe(const nb::handle& df) {
  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  const auto pa = import_pyarrow_checked();

  std::vector<std::string> labels{};
  for (const auto& label : df.attr("columns")) {
    labels.emplace_back(nb::cast<std::string>(nb::str(label)));
  }
  const auto num_rows = nb::cast<std::int64_t>(df.attr("__len__")());

  const auto pyarrow_table =
      pa.attr("Table").attr("from_pandas")(df, nb::arg("preserve_index") = false);
  const auto table = import_pyarrow_table(pyarrow_table);
  if (static_cast<std::size_t>(table->num_columns()) != labels.size()) {
    throw std::runtime_error(
        fmt::format(FMT_STRING("pandas.DataFrame has {} column(s), but {} were converted to arrow"),
                    labels.size(), table->num_columns()));
  }

  std::vector<FrameColumn> columns(labels.size());
  for (std::size_t i = 0; i < columns.size(); ++i) {
    auto data = table->column(static_cast<int>(i));
    const auto kind = infer_native_kind(*data->type());
    columns[i] = FrameColumn{std::move(labels[i]), std::move(data), kind};
  }

  SPDLOG_DEBUG(FMT_STRING("imported pandas.DataFrame with shape ({}, {})"), num_rows,
               columns.size());
  return Frame{std::move(columns), num_rows};
}

Frame import_frame(const nb::handle& df) {
  if (is_pandas_dataframe(df)) {
    return import_pandas_dataframe(df);
  }
  if (is_pyarrow_table(df)) {
    return Frame::from_table(*import_pyarrow_table(df));
  }

  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  throw std::invalid_argument(fmt::format(
      FMT_STRING("expected a pandas.DataFrame or a pyarrow.Table, found {}"),
      format_py_type(df.type())));
}

}  // namespace localtable
