// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <arrow/util/decimal.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace localtable {

class Value;

struct NullValue {};

struct DecimalValue {
  arrow::Decimal128 unscaled{};
  std::int32_t scale{};
};

struct BinaryValue {
  std::string bytes{};
};

struct DateValue {
  std::int32_t days{};  // since 1970-01-01
};

struct TimestampValue {
  std::int64_t micros{};  // since the epoch, UTC when tz_aware
  bool tz_aware{false};
};

struct IntervalValue {
  std::int64_t micros{};
};

struct ListValue {
  std::vector<Value> items{};
};

struct MapValue {
  std::vector<Value> keys{};
  std::vector<Value> values{};
};

// Unnamed rows behave like tuples
struct RowValue {
  std::vector<std::string> names{};
  std::vector<Value> values{};

  [[nodiscard]] bool is_named() const noexcept { return !names.empty(); }
};

struct ObjectValue {
  std::vector<std::string> names{};
  std::vector<Value> values{};
};

// clang-format off
using ValueVariant =
    std::variant<
        NullValue,
        bool,
        std::int64_t,
        double,
        DecimalValue,
        std::string,
        BinaryValue,
        DateValue,
        TimestampValue,
        IntervalValue,
        ListValue,
        MapValue,
        RowValue,
        ObjectValue
    >;
// clang-format on

class Value {
 public:
  using Variant = ValueVariant;

 private:
  Variant _value{};

 public:
  Value() = default;
  Value(bool value) : _value(value) {}  // NOLINT(*-explicit-conversions)
  Value(int value) : _value(std::int64_t{value}) {}  // NOLINT(*-explicit-conversions)
  Value(std::int64_t value) : _value(value) {}       // NOLINT(*-explicit-conversions)
  Value(double value) : _value(value) {}             // NOLINT(*-explicit-conversions)
  Value(const char *value) : _value(std::string{value}) {}  // NOLINT(*-explicit-conversions)
  template <typename T,
            typename std::enable_if_t<std::is_class_v<T> && !std::is_same_v<T, Value> &&
                                      std::is_constructible_v<Variant, T>> * = nullptr>
  Value(T value) : _value(std::move(value)) {}  // NOLINT(*-explicit-conversions)

  [[nodiscard]] static Value null() noexcept;
  [[nodiscard]] static Value binary(std::string bytes);
  // Parse a decimal literal such as "-12.345"
  [[nodiscard]] static Value decimal(std::string_view repr);
  [[nodiscard]] static Value date(std::int32_t days);
  [[nodiscard]] static Value timestamp(std::int64_t micros, bool tz_aware);
  [[nodiscard]] static Value interval(std::int64_t micros);
  [[nodiscard]] static Value list(std::vector<Value> items);
  [[nodiscard]] static Value tuple(std::vector<Value> values);
  [[nodiscard]] static Value row(std::vector<std::string> names, std::vector<Value> values);
  [[nodiscard]] static Value map(std::vector<std::pair<Value, Value>> entries);
  [[nodiscard]] static Value object(std::vector<std::pair<std::string, Value>> attributes);

  [[nodiscard]] const Variant &get() const noexcept { return _value; }
  template <typename T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(_value);
  }
  template <typename T>
  [[nodiscard]] const T &get() const {
    return std::get<T>(_value);
  }
  [[nodiscard]] bool is_null() const noexcept { return is<NullValue>(); }

  [[nodiscard]] std::string_view type_name() const noexcept;
  [[nodiscard]] std::string repr() const;
};

}  // namespace localtable
