// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/value.hpp"

#include <arrow/util/decimal.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/common.hpp"

namespace localtable {

Value Value::null() noexcept { return Value{}; }

Value Value::binary(std::string bytes) { return BinaryValue{std::move(bytes)}; }

Value Value::decimal(std::string_view repr) {
  arrow::Decimal128 unscaled{};
  std::int32_t precision{};
  std::int32_t scale{};
  const auto status = arrow::Decimal128::FromString(repr, &unscaled, &precision, &scale);
  if (!status.ok()) {
    throw std::invalid_argument(fmt::format(FMT_STRING("unable to parse \"{}\" as a decimal: {}"),
                                            repr, status.message()));
  }
  if (scale < 0) {
    auto res = unscaled.Rescale(scale, 0);
    if (!res.ok()) {
      throw std::invalid_argument(fmt::format(FMT_STRING("unable to rescale decimal \"{}\": {}"),
                                              repr, res.status().message()));
    }
    unscaled = res.MoveValueUnsafe();
    scale = 0;
  }
  return DecimalValue{unscaled, scale};
}

Value Value::date(std::int32_t days) { return DateValue{days}; }

Value Value::timestamp(std::int64_t micros, bool tz_aware) {
  return TimestampValue{micros, tz_aware};
}

Value Value::interval(std::int64_t micros) { return IntervalValue{micros}; }

Value Value::list(std::vector<Value> items) { return ListValue{std::move(items)}; }

Value Value::tuple(std::vector<Value> values) { return RowValue{{}, std::move(values)}; }

Value Value::row(std::vector<std::string> names, std::vector<Value> values) {
  if (names.size() != values.size()) {
    throw std::invalid_argument(
        fmt::format(FMT_STRING("row has {} field names but {} values"), names.size(),
                    values.size()));
  }
  return RowValue{std::move(names), std::move(values)};
}

Value Value::map(std::vector<std::pair<Value, Value>> entries) {
  MapValue map{};
  map.keys.reserve(entries.size());
  map.values.reserve(entries.size());
  for (auto &[k, v] : entries) {
    map.keys.emplace_back(std::move(k));
    map.values.emplace_back(std::move(v));
  }
  return map;
}

Value Value::object(std::vector<std::pair<std::string, Value>> attributes) {
  ObjectValue obj{};
  obj.names.reserve(attributes.size());
  obj.values.reserve(attributes.size());
  for (auto &[name, value] : attributes) {
    obj.names.emplace_back(std::move(name));
    obj.values.emplace_back(std::move(value));
  }
  return obj;
}

std::string_view Value::type_name() const noexcept {
  return std::visit(overloaded{[](const NullValue &) { return std::string_view{"null"}; },
                               [](bool) { return std::string_view{"bool"}; },
                               [](std::int64_t) { return std::string_view{"int"}; },
                               [](double) { return std::string_view{"float"}; },
                               [](const DecimalValue &) { return std::string_view{"decimal"}; },
                               [](const std::string &) { return std::string_view{"str"}; },
                               [](const BinaryValue &) { return std::string_view{"bytes"}; },
                               [](const DateValue &) { return std::string_view{"date"}; },
                               [](const TimestampValue &) { return std::string_view{"datetime"}; },
                               [](const IntervalValue &) { return std::string_view{"timedelta"}; },
                               [](const ListValue &) { return std::string_view{"list"}; },
                               [](const MapValue &) { return std::string_view{"dict"}; },
                               [](const RowValue &row) {
                                 return row.is_named() ? std::string_view{"Row"}
                                                       : std::string_view{"tuple"};
                               },
                               [](const ObjectValue &) { return std::string_view{"object"}; }},
                    _value);
}

template <typename It>
[[nodiscard]] static std::string join_repr(It first, It last) {
  std::string buff{};
  for (auto it = first; it != last; ++it) {
    if (it != first) {
      buff += ", ";
    }
    buff += it->repr();
  }
  return buff;
}

[[nodiscard]] static std::string join_named_repr(const std::vector<std::string> &names,
                                                 const std::vector<Value> &values) {
  std::string buff{};
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0) {
      buff += ", ";
    }
    buff += fmt::format(FMT_STRING("{}={}"), names.at(i), values[i].repr());
  }
  return buff;
}

std::string Value::repr() const {
  return std::visit(
      overloaded{
          [](const NullValue &) { return std::string{"None"}; },
          [](bool v) { return std::string{v ? "True" : "False"}; },
          [](std::int64_t v) { return fmt::to_string(v); },
          [](double v) { return fmt::to_string(v); },
          [](const DecimalValue &v) {
            return fmt::format(FMT_STRING("Decimal('{}')"), v.unscaled.ToString(v.scale));
          },
          [](const std::string &v) { return fmt::format(FMT_STRING("'{}'"), v); },
          [](const BinaryValue &v) {
            return fmt::format(FMT_STRING("<{} bytes>"), v.bytes.size());
          },
          [](const DateValue &v) { return fmt::format(FMT_STRING("date({})"), v.days); },
          [](const TimestampValue &v) {
            return fmt::format(FMT_STRING("datetime({}{})"), v.micros, v.tz_aware ? ", UTC" : "");
          },
          [](const IntervalValue &v) { return fmt::format(FMT_STRING("timedelta({})"), v.micros); },
          [](const ListValue &v) {
            return fmt::format(FMT_STRING("[{}]"), join_repr(v.items.begin(), v.items.end()));
          },
          [](const MapValue &v) {
            std::string buff{};
            for (std::size_t i = 0; i < v.keys.size(); ++i) {
              if (i != 0) {
                buff += ", ";
              }
              buff += fmt::format(FMT_STRING("{}: {}"), v.keys[i].repr(), v.values[i].repr());
            }
            return fmt::format(FMT_STRING("{{{}}}"), buff);
          },
          [](const RowValue &v) {
            if (!v.is_named()) {
              return fmt::format(FMT_STRING("({})"), join_repr(v.values.begin(), v.values.end()));
            }
            return fmt::format(FMT_STRING("Row({})"), join_named_repr(v.names, v.values));
          },
          [](const ObjectValue &v) {
            return fmt::format(FMT_STRING("object({})"), join_named_repr(v.names, v.values));
          }},
      _value);
}

}  // namespace localtable
