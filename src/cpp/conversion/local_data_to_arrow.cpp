// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/local_data_to_arrow.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/compute/api_scalar.h>
#include <arrow/datum.h>
#include <arrow/scalar.h>
#include <arrow/table.h>
#include <arrow/type.h>
#include <arrow/util/decimal.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/arrow_type.hpp"
#include "localtable/common.hpp"
#include "localtable/errors.hpp"
#include "localtable/safe_numeric_cast.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable {

namespace {

constexpr std::int64_t MICROS_PER_DAY{86'400'000'000};

[[nodiscard]] std::string child_path(std::string_view parent, std::string_view child) {
  if (parent.empty()) {
    return std::string{child};
  }
  return fmt::format(FMT_STRING("{}.{}"), parent, child);
}

[[noreturn]] void throw_conversion_error(const Value &value, const DataType &type,
                                         std::string_view path) {
  throw ValueConversionError(
      path, fmt::format(FMT_STRING("cannot convert {} ({}) to {}"), value.repr(), value.type_name(),
                        type.simple_string()));
}

void check_status(const arrow::Status &status, std::string_view path) {
  if (LOCALTABLE_UNLIKELY(!status.ok())) {
    throw std::runtime_error(fmt::format(FMT_STRING("failed to append value for field \"{}\": {}"),
                                         path, status.message()));
  }
}

template <typename Builder>
[[nodiscard]] Builder &builder_cast(arrow::ArrayBuilder &builder) {
  return static_cast<Builder &>(builder);  // NOLINT(*-static-cast-downcast)
}

// Values of a struct-like value in the order of the fields of type, nullptr for missing fields
[[nodiscard]] std::vector<const Value *> lookup_by_name(const std::vector<std::string> &names,
                                                        const std::vector<Value> &values,
                                                        const StructType &type) {
  std::vector<const Value *> result(type.size(), nullptr);
  for (std::size_t i = 0; i < type.size(); ++i) {
    const auto match = std::find(names.begin(), names.end(), type[i].name);
    if (match != names.end()) {
      result[i] = &values[static_cast<std::size_t>(std::distance(names.begin(), match))];
    }
  }
  return result;
}

[[nodiscard]] std::vector<const Value *> lookup_by_position(const std::vector<Value> &values,
                                                            const StructType &type,
                                                            std::string_view path) {
  if (values.size() > type.size()) {
    throw ValueConversionError(
        path.empty() ? std::string_view{"record"} : path,
        fmt::format(FMT_STRING("expected at most {} value(s), found {}"), type.size(),
                    values.size()));
  }
  std::vector<const Value *> result(type.size(), nullptr);
  for (std::size_t i = 0; i < values.size(); ++i) {
    result[i] = &values[i];
  }
  return result;
}

[[nodiscard]] std::vector<const Value *> lookup_map_keys(const MapValue &map,
                                                         const StructType &type) {
  std::vector<const Value *> result(type.size(), nullptr);
  for (std::size_t i = 0; i < type.size(); ++i) {
    for (std::size_t j = 0; j < map.keys.size(); ++j) {
      const auto &key = map.keys[j];
      if (key.is<std::string>() && key.get<std::string>() == type[i].name) {
        result[i] = &map.values[j];
        break;
      }
    }
  }
  return result;
}

[[nodiscard]] bool has_all_names(const std::vector<std::string> &names, const StructType &type) {
  return std::all_of(type.begin(), type.end(), [&](const StructField &f) {
    return std::find(names.begin(), names.end(), f.name) != names.end();
  });
}

[[nodiscard]] std::vector<const Value *> struct_values(const Value &value, const StructType &type,
                                                       std::string_view path) {
  if (value.is<MapValue>()) {
    return lookup_map_keys(value.get<MapValue>(), type);
  }
  if (value.is<ObjectValue>()) {
    const auto &obj = value.get<ObjectValue>();
    return lookup_by_name(obj.names, obj.values, type);
  }
  if (value.is<RowValue>()) {
    const auto &row = value.get<RowValue>();
    if (row.is_named() && has_all_names(row.names, type)) {
      return lookup_by_name(row.names, row.values, type);
    }
    return lookup_by_position(row.values, type, path);
  }
  if (value.is<ListValue>()) {
    return lookup_by_position(value.get<ListValue>().items, type, path);
  }

  throw_conversion_error(value, type, path);
}

// Converts between UTC instants and wall-clock times of the session timezone
class SessionClock {
  std::string _timezone;

 public:
  explicit SessionClock(std::string_view timezone) : _timezone(timezone) {
    if (!is_utc()) {
      internal::init_arrow_compute();
    }
  }

  [[nodiscard]] bool is_utc() const noexcept { return _timezone.empty() || _timezone == "UTC"; }

  [[nodiscard]] std::int64_t to_wall_clock(std::int64_t instant, std::string_view path) const {
    if (is_utc()) {
      return instant;
    }
    auto scalar = std::make_shared<arrow::TimestampScalar>(
        instant, arrow::timestamp(arrow::TimeUnit::MICRO, _timezone));
    return unwrap(arrow::compute::LocalTimestamp(arrow::Datum{std::move(scalar)}), path);
  }

  [[nodiscard]] std::int64_t to_instant(std::int64_t wall_clock, std::string_view path) const {
    if (is_utc()) {
      return wall_clock;
    }
    auto scalar = std::make_shared<arrow::TimestampScalar>(
        wall_clock, arrow::timestamp(arrow::TimeUnit::MICRO));
    return unwrap(arrow::compute::AssumeTimezone(arrow::Datum{std::move(scalar)},
                                                 arrow::compute::AssumeTimezoneOptions{_timezone}),
                  path);
  }

 private:
  [[nodiscard]] std::int64_t unwrap(arrow::Result<arrow::Datum> res, std::string_view path) const {
    if (!res.ok()) {
      throw ValueConversionError(
          path, fmt::format(FMT_STRING("cannot convert timestamp using timezone {}: {}"),
                            _timezone, res.status().message()));
    }
    // NOLINTNEXTLINE(*-static-cast-downcast)
    return static_cast<const arrow::TimestampScalar &>(*res.ValueUnsafe().scalar()).value;
  }
};

class ValueAppender {
  const SessionClock &_clock;
  std::string_view _path;

 public:
  ValueAppender(const SessionClock &clock, std::string_view path) noexcept
      : _clock(clock), _path(path) {}

  static void append(arrow::ArrayBuilder &builder, const DataType &type, const Value *value,
                     const SessionClock &clock, std::string_view path) {
    if (!value || value->is_null()) {
      check_status(builder.AppendNull(), path);
      return;
    }
    ValueAppender appender{clock, path};
    std::visit([&](const auto &t) { appender.append(builder, type, t, *value); }, type.get());
  }

 private:
  void append([[maybe_unused]] arrow::ArrayBuilder &builder, const DataType &type,
              const NullType &, const Value &value) const {
    throw_conversion_error(value, type, _path);
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const BooleanType &,
              const Value &value) const {
    if (!value.is<bool>()) {
      throw_conversion_error(value, type, _path);
    }
    check_status(builder_cast<arrow::BooleanBuilder>(builder).Append(value.get<bool>()), _path);
  }

  template <typename Builder, typename N>
  void append_integer(arrow::ArrayBuilder &builder, const DataType &type,
                      const Value &value) const {
    std::int64_t n{};
    if (value.is<std::int64_t>()) {
      n = value.get<std::int64_t>();
    } else if (value.is<bool>()) {
      n = value.get<bool>() ? 1 : 0;
    } else {
      throw_conversion_error(value, type, _path);
    }

    N converted{};
    try {
      converted = safe_numeric_cast<N>(_path, n);
    } catch (const std::invalid_argument &e) {
      throw ValueConversionError(_path, e.what());
    }
    check_status(builder_cast<Builder>(builder).Append(converted), _path);
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const IntegerType &t,
              const Value &value) const {
    // NOLINTBEGIN(*-avoid-magic-numbers)
    switch (t.bit_width) {
      case 8:
        return append_integer<arrow::Int8Builder, std::int8_t>(builder, type, value);
      case 16:
        return append_integer<arrow::Int16Builder, std::int16_t>(builder, type, value);
      case 32:
        return append_integer<arrow::Int32Builder, std::int32_t>(builder, type, value);
      case 64:
        return append_integer<arrow::Int64Builder, std::int64_t>(builder, type, value);
      default:
        unreachable_code();
    }
    // NOLINTEND(*-avoid-magic-numbers)
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const FloatType &t,
              const Value &value) const {
    double n{};
    if (value.is<double>()) {
      n = value.get<double>();
    } else if (value.is<std::int64_t>()) {
      n = safe_numeric_cast<double>(value.get<std::int64_t>());
    } else if (value.is<DecimalValue>()) {
      const auto &d = value.get<DecimalValue>();
      n = d.unscaled.ToDouble(d.scale);
    } else {
      throw_conversion_error(value, type, _path);
    }

    if (t.bit_width == 32) {  // NOLINT(*-avoid-magic-numbers)
      check_status(builder_cast<arrow::FloatBuilder>(builder).Append(safe_numeric_cast<float>(n)),
                   _path);
      return;
    }
    check_status(builder_cast<arrow::DoubleBuilder>(builder).Append(n), _path);
  }

  [[nodiscard]] arrow::Decimal128 to_decimal(const DataType &type, const DecimalType &t,
                                             const Value &value) const {
    arrow::Result<arrow::Decimal128> res{};
    if (value.is<DecimalValue>()) {
      const auto &d = value.get<DecimalValue>();
      res = d.unscaled.Rescale(d.scale, t.scale);
    } else if (value.is<std::int64_t>()) {
      res = arrow::Decimal128{value.get<std::int64_t>()}.Rescale(0, t.scale);
    } else if (value.is<double>()) {
      res = arrow::Decimal128::FromReal(value.get<double>(), t.precision, t.scale);
    } else {
      throw_conversion_error(value, type, _path);
    }

    if (!res.ok()) {
      throw ValueConversionError(
          _path, fmt::format(FMT_STRING("cannot convert {} to {}: {}"), value.repr(),
                             type.simple_string(), res.status().message()));
    }
    auto decimal = res.MoveValueUnsafe();
    if (!decimal.FitsInPrecision(t.precision)) {
      throw ValueConversionError(
          _path, fmt::format(FMT_STRING("{} does not fit in {}"), value.repr(),
                             type.simple_string()));
    }
    return decimal;
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const DecimalType &t,
              const Value &value) const {
    check_status(builder_cast<arrow::Decimal128Builder>(builder).Append(to_decimal(type, t, value)),
                 _path);
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const StringType &,
              const Value &value) const {
    auto &string_builder = builder_cast<arrow::StringBuilder>(builder);
    std::visit(overloaded{[&](const std::string &s) {
                            check_status(string_builder.Append(s), _path);
                          },
                          [&](bool b) {
                            check_status(string_builder.Append(b ? "true" : "false"), _path);
                          },
                          [&](std::int64_t n) {
                            check_status(string_builder.Append(fmt::to_string(n)), _path);
                          },
                          [&](double n) {
                            check_status(string_builder.Append(fmt::to_string(n)), _path);
                          },
                          [&](const DecimalValue &d) {
                            check_status(string_builder.Append(d.unscaled.ToString(d.scale)),
                                         _path);
                          },
                          [&](const auto &) { throw_conversion_error(value, type, _path); }},
               value.get());
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const BinaryType &,
              const Value &value) const {
    auto &binary_builder = builder_cast<arrow::BinaryBuilder>(builder);
    if (value.is<BinaryValue>()) {
      check_status(binary_builder.Append(value.get<BinaryValue>().bytes), _path);
      return;
    }
    if (value.is<std::string>()) {
      check_status(binary_builder.Append(value.get<std::string>()), _path);
      return;
    }
    throw_conversion_error(value, type, _path);
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const DateType &,
              const Value &value) const {
    std::int32_t days{};
    if (value.is<DateValue>()) {
      days = value.get<DateValue>().days;
    } else if (value.is<TimestampValue>()) {
      const auto &ts = value.get<TimestampValue>();
      const auto micros = ts.tz_aware ? _clock.to_wall_clock(ts.micros, _path) : ts.micros;
      auto q = micros / MICROS_PER_DAY;
      if (micros % MICROS_PER_DAY < 0) {
        --q;
      }
      days = static_cast<std::int32_t>(q);
    } else {
      throw_conversion_error(value, type, _path);
    }
    check_status(builder_cast<arrow::Date32Builder>(builder).Append(days), _path);
  }

  // Naive values are wall-clock times of the session timezone
  void append(arrow::ArrayBuilder &builder, const DataType &type, const TimestampType &t,
              const Value &value) const {
    std::int64_t micros{};
    if (value.is<TimestampValue>()) {
      const auto &ts = value.get<TimestampValue>();
      micros = ts.micros;
      if (ts.tz_aware && t.ntz) {
        micros = _clock.to_wall_clock(micros, _path);
      } else if (!ts.tz_aware && !t.ntz) {
        micros = _clock.to_instant(micros, _path);
      }
    } else if (value.is<DateValue>()) {
      micros = std::int64_t{value.get<DateValue>().days} * MICROS_PER_DAY;
      if (!t.ntz) {
        micros = _clock.to_instant(micros, _path);
      }
    } else {
      throw_conversion_error(value, type, _path);
    }
    check_status(builder_cast<arrow::TimestampBuilder>(builder).Append(micros), _path);
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const DayTimeIntervalType &,
              const Value &value) const {
    if (!value.is<IntervalValue>()) {
      throw_conversion_error(value, type, _path);
    }
    check_status(
        builder_cast<arrow::DurationBuilder>(builder).Append(value.get<IntervalValue>().micros),
        _path);
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const ArrayType &t,
              const Value &value) const {
    const std::vector<Value> *items{};
    if (value.is<ListValue>()) {
      items = &value.get<ListValue>().items;
    } else if (value.is<RowValue>() && !value.get<RowValue>().is_named()) {
      items = &value.get<RowValue>().values;
    } else {
      throw_conversion_error(value, type, _path);
    }

    auto &list_builder = builder_cast<arrow::ListBuilder>(builder);
    check_status(list_builder.Append(), _path);
    const auto path = child_path(_path, "element");
    for (const auto &item : *items) {
      ValueAppender::append(*list_builder.value_builder(), t.element(), &item, _clock, path);
    }
  }

  void append(arrow::ArrayBuilder &builder, const DataType &type, const MapType &t,
              const Value &value) const {
    if (!value.is<MapValue>()) {
      throw_conversion_error(value, type, _path);
    }

    const auto &map = value.get<MapValue>();
    auto &map_builder = builder_cast<arrow::MapBuilder>(builder);
    check_status(map_builder.Append(), _path);
    const auto key_path = child_path(_path, "key");
    const auto value_path = child_path(_path, "value");
    for (std::size_t i = 0; i < map.keys.size(); ++i) {
      if (map.keys[i].is_null()) {
        throw ValueConversionError(key_path, "map keys cannot be null");
      }
      ValueAppender::append(*map_builder.key_builder(), t.key(), &map.keys[i], _clock, key_path);
      ValueAppender::append(*map_builder.item_builder(), t.value(), &map.values[i], _clock,
                            value_path);
    }
  }

  void append(arrow::ArrayBuilder &builder, const DataType &, const StructType &t,
              const Value &value) const {
    const auto values = struct_values(value, t, _path);
    auto &struct_builder = builder_cast<arrow::StructBuilder>(builder);
    check_status(struct_builder.Append(), _path);
    for (std::size_t i = 0; i < t.size(); ++i) {
      ValueAppender::append(*struct_builder.field_builder(static_cast<int>(i)), t[i].type(),
                            values[i], _clock, child_path(_path, t[i].name));
    }
  }
};

}  // namespace

std::shared_ptr<arrow::Table> LocalDataToArrowConversion::convert(
    const std::vector<Value> &records, const StructType &schema,
    std::string_view session_timezone) {
  auto arrow_schema = to_arrow_schema(schema);
  SPDLOG_DEBUG(FMT_STRING("converting {} record(s) to an arrow::Table with schema {}..."),
               records.size(), DataType{schema}.simple_string());

  std::vector<std::unique_ptr<arrow::ArrayBuilder>> builders{};
  builders.reserve(schema.size());
  for (const auto &field : arrow_schema->fields()) {
    auto res = arrow::MakeBuilder(field->type());
    if (!res.ok()) {
      throw std::runtime_error(
          fmt::format(FMT_STRING("failed to create a builder for field \"{}\": {}"), field->name(),
                      res.status().message()));
    }
    builders.emplace_back(res.MoveValueUnsafe());
    check_status(builders.back()->Reserve(static_cast<std::int64_t>(records.size())),
                 field->name());
  }

  const SessionClock clock{session_timezone};
  for (const auto &record : records) {
    const auto values = struct_values(record, schema, "");
    for (std::size_t i = 0; i < schema.size(); ++i) {
      ValueAppender::append(*builders[i], schema[i].type(), values[i], clock, schema[i].name);
    }
  }

  arrow::ArrayVector columns{};
  columns.reserve(builders.size());
  for (std::size_t i = 0; i < builders.size(); ++i) {
    auto res = builders[i]->Finish();
    if (!res.ok()) {
      throw std::runtime_error(fmt::format(FMT_STRING("failed to build column \"{}\": {}"),
                                           schema[i].name, res.status().message()));
    }
    columns.emplace_back(res.MoveValueUnsafe());
  }

  return arrow::Table::Make(std::move(arrow_schema), columns,
                            static_cast<std::int64_t>(records.size()));
}

}  // namespace localtable
