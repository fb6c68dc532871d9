// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "localtable/create_table.hpp"
#include "localtable/errors.hpp"
#include "localtable/logger.hpp"
#include "localtable/nanobind.hpp"
#include "localtable/py_data_type.hpp"
#include "localtable/py_local_relation.hpp"
#include "localtable/python_input.hpp"
#include "localtable/table.hpp"

namespace nb = nanobind;
namespace localtable {

static void set_nanobind_leak_warnings() {
#ifndef NDEBUG
  const auto x = true;
#else
  const auto x = false;
#endif
  // Leaks appear to only occur when the interpreter shuts down abruptly
  nb::set_leak_warnings(x);
}

[[nodiscard]] static std::unique_ptr<Logger> init_logger() {
  try {
    auto logger = std::make_unique<Logger>(spdlog::level::trace);
    nb::module_::import_("atexit").attr("register")(
        nb::cpp_function([logger_ptr = logger.get()]() { logger_ptr->shutdown(); }));
    return logger;
  } catch (const std::exception& e) {
    warn(PyExc_RuntimeWarning, FMT_STRING("failed to configure localtable's logger: {}"),
         e.what());
  }
  return {};
}

static void register_exceptions(nb::module_& m) {
  // Python translators are tried in reverse order of registration: the base class goes first
  const nb::exception<LocalTableError> base(m, "LocalTableError", PyExc_ValueError);
  const auto type_error_bases = nb::make_tuple(base, nb::handle(PyExc_TypeError));

  nb::exception<EmptyInputError>(m, "EmptyInputError", base);
  nb::exception<InvalidRankError>(m, "InvalidRankError", base);
  nb::exception<AxisLengthMismatchError>(m, "AxisLengthMismatchError", base);
  nb::exception<TypeMergeError>(m, "TypeMergeError", type_error_bases);
  nb::exception<UnresolvedTypeError>(m, "UnresolvedTypeError", base);
  nb::exception<InvalidInputTypeError>(m, "InvalidInputTypeError", type_error_bases);
  nb::exception<UnsupportedTypeForEncodingError>(m, "UnsupportedTypeForEncodingError",
                                                 type_error_bases);
  nb::exception<ValueConversionError>(m, "ValueConversionError", base);
  nb::exception<DdlParseError>(m, "DdlParseError", base);
}

static constexpr const char* create_table_doc =
    "Convert local data to a columnar table.\n"
    "data can be a pandas.DataFrame, a pyarrow.Table, a 1D or 2D numpy.ndarray or an iterable "
    "of records (dicts, tuples, named tuples, lists, objects or scalars).\n"
    "schema can be a DataType, a DDL string or a list of column names.\n"
    "conf is a dictionary with the session configuration.";

NB_MODULE(_localtable, m) {
  set_nanobind_leak_warnings();
  static const auto logger = init_logger();

  m.doc() = "Convert in-memory Python data to strongly typed columnar tables.";

  register_exceptions(m);
  bind_data_type(m);
  PyLocalRelation::bind(m);

  m.def(
      "create_table",
      [&](nb::handle data, nb::handle schema,
          const std::optional<std::map<std::string, std::string>>& conf) {
        // Forward the records logged by the core whether the call succeeds or not
        const struct LogFlusher {
          const std::unique_ptr<Logger>& logger;
          ~LogFlusher() noexcept {
            if (logger) {
              logger->flush();
            }
          }
        } flusher{logger};

        const auto local_data = import_local_data(data);
        const auto schema_arg = import_schema_arg(schema);
        const auto ctx = make_session_context(conf);

        auto relation = [&]() {
          [[maybe_unused]] const nb::gil_scoped_release gil{};
          return create_table(local_data, schema_arg, ctx);
        }();
        return PyLocalRelation{std::move(relation)};
      },
      nb::arg("data"), nb::arg("schema") = nb::none(), nb::arg("conf") = nb::none(),
      nb::sig("def create_table(data: object, schema: object = None, "
              "conf: dict[str, str] | None = None) -> localtable.LocalRelation"),
      create_table_doc, nb::rv_policy::move);

  auto logging = m.def_submodule("logging");
  logging.def(
      "setLevel",
      [&](const std::variant<std::int64_t, std::string>& level) {
        if (logger) {
          logger->set_level(level);
        }
      },
      nb::arg("level"),
      "Set the log level for localtable's logger.\n"
      "Accepts the predefined levels defined by the logging module.");

  logging.def(
      "flush",
      []() {
        if (logger) {
          logger->flush();
        }
      },
      "Flush all log messages.");
}

}  // namespace localtable
