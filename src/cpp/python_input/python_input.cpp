// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/python_input.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "localtable/create_table.hpp"
#include "localtable/errors.hpp"
#include "localtable/nanobind.hpp"
#include "localtable/ndarray.hpp"
#include "localtable/py_local_relation.hpp"
#include "localtable/pyarrow.hpp"
#include "localtable/session_context.hpp"
#include "localtable/type.hpp"
#include "localtable/value.hpp"
#include "localtable/variant.hpp"

namespace nb = nanobind;

namespace localtable {

// Returns the module only when it was already imported by the caller.
[[nodiscard]] static std::optional<nb::object> get_loaded_module(const char *name) {
  auto module = nb::module_::import_("sys").attr("modules").attr("get")(name);
  if (module.is_none()) {
    return {};
  }
  return module;
}

namespace {

// Resolves the Python types recognized while converting records to Values.
class ValueImporter {
  nb::object _datetime_type;
  nb::object _date_type;
  nb::object _timedelta_type;
  nb::object _time_type;
  nb::object _decimal_type;
  nb::object _bytes_type;
  nb::object _bytearray_type;
  std::optional<nb::object> _numpy_generic{};
  nb::object _naive_epoch;
  nb::object _utc_epoch;
  nb::object _date_epoch;

 public:
  ValueImporter() {
    const auto datetime = nb::module_::import_("datetime");
    _datetime_type = datetime.attr("datetime");
    _date_type = datetime.attr("date");
    _timedelta_type = datetime.attr("timedelta");
    _time_type = datetime.attr("time");
    _decimal_type = nb::module_::import_("decimal").attr("Decimal");
    const auto builtins = nb::module_::import_("builtins");
    _bytes_type = builtins.attr("bytes");
    _bytearray_type = builtins.attr("bytearray");
    if (auto np = get_loaded_module("numpy"); np.has_value()) {
      _numpy_generic = np->attr("generic");
    }
    _naive_epoch = _datetime_type(1970, 1, 1);
    _utc_epoch = _datetime_type(1970, 1, 1,
                                nb::arg("tzinfo") = datetime.attr("timezone").attr("utc"));
    _date_epoch = _date_type(1970, 1, 1);
  }

  [[nodiscard]] Value operator()(const nb::handle &obj) const {
    if (obj.is_none()) {
      return Value::null();
    }
    // bool must be checked before int
    if (nb::isinstance<nb::bool_>(obj)) {
      return nb::cast<bool>(obj);
    }
    if (nb::isinstance<nb::int_>(obj)) {
      return import_int(obj);
    }
    if (nb::isinstance<nb::float_>(obj)) {
      return nb::cast<double>(obj);
    }
    if (nb::isinstance<nb::str>(obj)) {
      return Value{nb::cast<std::string>(obj)};
    }
    if (nb::isinstance<nb::bytes>(obj) || nb::isinstance(obj, _bytearray_type)) {
      const auto buff = nb::borrow<nb::bytes>(_bytes_type(obj));
      return Value::binary(std::string{static_cast<const char *>(buff.data()), buff.size()});
    }
    if (nb::isinstance(obj, _decimal_type)) {
      return Value::decimal(nb::cast<std::string>(nb::str(obj)));
    }
    // datetime is a subclass of date
    if (nb::isinstance(obj, _datetime_type)) {
      return import_datetime(obj);
    }
    if (nb::isinstance(obj, _date_type)) {
      const auto days = nb::cast<std::int64_t>((obj - _date_epoch).attr("days"));
      return Value::date(static_cast<std::int32_t>(days));
    }
    if (nb::isinstance(obj, _timedelta_type)) {
      return Value::interval(timedelta_to_micros(obj));
    }
    if (_numpy_generic.has_value() && nb::isinstance(obj, *_numpy_generic)) {
      return (*this)(obj.attr("item")());
    }
    if (nb::isinstance<nb::dict>(obj)) {
      return import_dict(nb::borrow<nb::dict>(obj));
    }
    if (nb::isinstance<nb::tuple>(obj)) {
      return import_tuple(obj);
    }
    if (nb::isinstance<nb::list>(obj)) {
      std::vector<Value> items{};
      for (const auto &item : obj) {
        items.emplace_back((*this)(item));
      }
      return Value::list(std::move(items));
    }
    if (nb::isinstance(obj, _time_type) || !nb::hasattr(obj, "__dict__")) {
      throw InvalidInputTypeError("data", format_py_type(obj.type()));
    }
    auto attrs = obj.attr("__dict__");
    if (!nb::isinstance<nb::dict>(attrs)) {
      throw InvalidInputTypeError("data", format_py_type(obj.type()));
    }

    std::vector<std::pair<std::string, Value>> attributes{};
    for (const auto &[name, value] : nb::borrow<nb::dict>(attrs)) {
      attributes.emplace_back(nb::cast<std::string>(name), (*this)(value));
    }
    return Value::object(std::move(attributes));
  }

 private:
  [[nodiscard]] static Value import_int(const nb::handle &obj) {
    std::int64_t value{};
    if (!nb::try_cast(obj, value)) {
      throw ValueConversionError(
          "data", fmt::format(FMT_STRING("integer {} does not fit in a bigint"),
                              nb::cast<std::string>(nb::str(obj))));
    }
    return value;
  }

  [[nodiscard]] static std::int64_t timedelta_to_micros(const nb::handle &delta) {
    constexpr std::int64_t micros_per_second = 1'000'000;
    constexpr std::int64_t micros_per_day = 86'400 * micros_per_second;
    constexpr auto max_days = std::numeric_limits<std::int64_t>::max() / micros_per_day;

    const auto days = nb::cast<std::int64_t>(delta.attr("days"));
    const auto seconds = nb::cast<std::int64_t>(delta.attr("seconds"));
    const auto micros = nb::cast<std::int64_t>(delta.attr("microseconds"));
    if (days >= max_days || days <= -max_days) {
      throw ValueConversionError(
          "data", fmt::format(FMT_STRING("timedelta of {} days cannot be represented in "
                                         "microseconds"),
                              days));
    }
    return (days * micros_per_day) + (seconds * micros_per_second) + micros;
  }

  [[nodiscard]] Value import_datetime(const nb::handle &obj) const {
    const auto tz_aware = !obj.attr("utcoffset")().is_none();
    const auto &epoch = tz_aware ? _utc_epoch : _naive_epoch;
    return Value::timestamp(timedelta_to_micros(obj - epoch), tz_aware);
  }

  [[nodiscard]] Value import_dict(const nb::dict &obj) const {
    std::vector<std::pair<Value, Value>> entries{};
    entries.reserve(obj.size());
    for (const auto &[key, value] : obj) {
      entries.emplace_back((*this)(key), (*this)(value));
    }
    return Value::map(std::move(entries));
  }

  // namedtuple-like objects become named rows, plain tuples become unnamed rows
  [[nodiscard]] Value import_tuple(const nb::handle &obj) const {
    std::vector<Value> values{};
    for (const auto &item : obj) {
      values.emplace_back((*this)(item));
    }

    for (const auto *attr : {"__fields__", "_fields"}) {
      if (nb::hasattr(obj, attr)) {
        auto names = nb::cast<std::vector<std::string>>(obj.attr(attr));
        return Value::row(std::move(names), std::move(values));
      }
    }
    return Value::tuple(std::move(values));
  }
};

}  // namespace

Value import_value(const nb::handle &obj) { return ValueImporter{}(obj); }

template <typename T>
[[nodiscard]] static NDArray import_ndarray_typed(const nb::handle &array,
                                                  std::vector<std::int64_t> shape) {
  const auto view = nb::cast<nb::ndarray<const T, nb::c_contig>>(array);
  // NOLINTNEXTLINE(*-pointer-arithmetic)
  std::vector<T> buff(view.data(), view.data() + view.size());
  return {std::move(shape), NumericBuffer{std::move(buff)}};
}

NDArray import_ndarray(const nb::handle &array) {
  const auto np = import_module_checked("numpy", "numpy.ndarray input");
  auto contiguous = np.attr("ascontiguousarray")(array);

  const auto rank = nb::cast<std::int64_t>(contiguous.attr("ndim"));
  auto shape = nb::cast<std::vector<std::int64_t>>(contiguous.attr("shape"));
  const auto dtype = nb::cast<std::string>(contiguous.attr("dtype").attr("name"));

  SPDLOG_DEBUG(FMT_STRING("importing numpy.ndarray of rank {} and dtype {}"), rank, dtype);

  // clang-format off
  if (dtype == "uint8")   { return import_ndarray_typed<std::uint8_t>(contiguous, std::move(shape)); }
  if (dtype == "uint16")  { return import_ndarray_typed<std::uint16_t>(contiguous, std::move(shape)); }
  if (dtype == "uint32")  { return import_ndarray_typed<std::uint32_t>(contiguous, std::move(shape)); }
  if (dtype == "uint64")  { return import_ndarray_typed<std::uint64_t>(contiguous, std::move(shape)); }
  if (dtype == "int8")    { return import_ndarray_typed<std::int8_t>(contiguous, std::move(shape)); }
  if (dtype == "int16")   { return import_ndarray_typed<std::int16_t>(contiguous, std::move(shape)); }
  if (dtype == "int32")   { return import_ndarray_typed<std::int32_t>(contiguous, std::move(shape)); }
  if (dtype == "int64")   { return import_ndarray_typed<std::int64_t>(contiguous, std::move(shape)); }
  if (dtype == "float32") { return import_ndarray_typed<float>(contiguous, std::move(shape)); }
  if (dtype == "float64") { return import_ndarray_typed<double>(contiguous, std::move(shape)); }
  // clang-format on

  if (rank != 1 && rank != 2) {
    throw InvalidRankError(rank);
  }
  throw InvalidInputTypeError("data", fmt::format(FMT_STRING("numpy.ndarray of dtype {}"), dtype));
}

LocalData import_local_data(const nb::handle &data) {
  if (nb::isinstance<PyLocalRelation>(data)) {
    return TableHandle{nb::cast<const PyLocalRelation &>(data).relation()};
  }

  if (is_pandas_dataframe(data) || is_pyarrow_table(data)) {
    return import_frame(data);
  }

  if (auto np = get_loaded_module("numpy"); np.has_value()) {
    if (nb::isinstance(data, np->attr("ndarray"))) {
      return import_ndarray(data);
    }
  }

  if (nb::isinstance<nb::str>(data) || nb::isinstance<nb::bytes>(data) ||
      !nb::hasattr(data, "__iter__")) {
    throw InvalidInputTypeError("data", format_py_type(data.type()));
  }

  const ValueImporter importer{};
  RecordSequence records{};
  for (const auto &record : data) {
    records.emplace_back(importer(record));
  }

  SPDLOG_DEBUG(FMT_STRING("imported {} records of type {}"), records.size(),
               format_py_type(data.type()));
  return records;
}

SchemaArg import_schema_arg(const nb::handle &schema) {
  if (schema.is_none()) {
    return std::monostate{};
  }
  if (nb::isinstance<DataType>(schema)) {
    return nb::cast<DataType>(schema);
  }
  if (nb::isinstance<nb::str>(schema)) {
    return nb::cast<std::string>(schema);
  }
  if (nb::isinstance<nb::list>(schema) || nb::isinstance<nb::tuple>(schema)) {
    std::vector<std::string> names{};
    for (const auto &name : schema) {
      if (!nb::isinstance<nb::str>(name)) {
        throw InvalidInputTypeError("schema", fmt::format(FMT_STRING("list containing {}"),
                                                          format_py_type(name.type())));
      }
      names.emplace_back(nb::cast<std::string>(name));
    }
    return names;
  }

  throw InvalidInputTypeError("schema", format_py_type(schema.type()));
}

StaticSessionContext make_session_context(
    const std::optional<std::map<std::string, std::string>> &conf) {
  if (!conf.has_value()) {
    return {};
  }
  return StaticSessionContext{
      std::map<std::string, std::string, std::less<>>{conf->begin(), conf->end()}};
}

}  // namespace localtable
