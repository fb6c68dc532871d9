// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace localtable {

class DataType;

struct NullType {};
struct BooleanType {};
struct IntegerType {
  std::uint8_t bit_width{64};  // NOLINT(*-avoid-magic-numbers)
};
struct FloatType {
  std::uint8_t bit_width{64};  // NOLINT(*-avoid-magic-numbers)
};
struct DecimalType {
  static constexpr std::int32_t MAX_PRECISION{38};
  std::int32_t precision{10};  // NOLINT(*-avoid-magic-numbers)
  std::int32_t scale{0};
};
struct StringType {};
struct BinaryType {};
struct DateType {};
struct TimestampType {
  bool ntz{false};
};
struct DayTimeIntervalType {};

struct ArrayType {
  std::shared_ptr<const DataType> element_type;
  bool contains_null{true};

  explicit ArrayType(DataType element, bool contains_null_ = true);
  [[nodiscard]] const DataType &element() const noexcept;
};

struct MapType {
  std::shared_ptr<const DataType> key_type;
  std::shared_ptr<const DataType> value_type;
  bool value_contains_null{true};

  MapType(DataType key, DataType value, bool value_contains_null_ = true);
  [[nodiscard]] const DataType &key() const noexcept;
  [[nodiscard]] const DataType &value() const noexcept;
};

struct StructField {
  std::string name;
  std::shared_ptr<const DataType> data_type;
  bool nullable{true};

  StructField(std::string name_, DataType type_, bool nullable_ = true);
  [[nodiscard]] const DataType &type() const noexcept;
};

class StructType {
  std::vector<StructField> _fields{};

 public:
  using const_iterator = std::vector<StructField>::const_iterator;

  StructType() = default;
  explicit StructType(std::vector<StructField> fields);

  StructType &add(std::string name, DataType type, bool nullable = true);
  StructType &add(StructField field);

  [[nodiscard]] const std::vector<StructField> &fields() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const StructField &operator[](std::size_t i) const;
  [[nodiscard]] const StructField *find(std::string_view name) const noexcept;
  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] StructType rename(const std::vector<std::string> &names) const;
  [[nodiscard]] std::string to_ddl() const;

  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;
};

using Schema = StructType;

// Order must match the alternatives of DataType::Variant
enum class TypeId : std::uint_fast8_t {
  NULL_TYPE,
  BOOLEAN,
  INTEGER,
  FLOAT,
  DECIMAL,
  STRING,
  BINARY,
  DATE,
  TIMESTAMP,
  DAY_TIME_INTERVAL,
  ARRAY,
  MAP,
  STRUCT
};

// clang-format off
using DataTypeVariant =
    std::variant<
        NullType,
        BooleanType,
        IntegerType,
        FloatType,
        DecimalType,
        StringType,
        BinaryType,
        DateType,
        TimestampType,
        DayTimeIntervalType,
        ArrayType,
        MapType,
        StructType
    >;
// clang-format on

namespace internal {
template <typename T, typename Variant>
struct is_variant_alternative : std::false_type {};

template <typename T, typename... Ts>
struct is_variant_alternative<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};
}  // namespace internal

class DataType {
 public:
  using Variant = DataTypeVariant;

 private:
  Variant _type{};

 public:
  template <typename T>
  static constexpr bool is_type_v = internal::is_variant_alternative<T, Variant>::value;

  DataType() = default;
  template <typename T, typename std::enable_if_t<is_type_v<T>> * = nullptr>
  DataType(T type) : _type(std::move(type)) {}  // NOLINT(*-explicit-conversions)

  [[nodiscard]] TypeId id() const noexcept;
  [[nodiscard]] const Variant &get() const noexcept;
  template <typename T>
  [[nodiscard]] bool is() const noexcept;
  template <typename T>
  [[nodiscard]] const T &get() const;

  [[nodiscard]] bool is_null() const noexcept;
  [[nodiscard]] bool is_numeric() const noexcept;
  [[nodiscard]] bool is_atomic() const noexcept;
  [[nodiscard]] bool is_struct() const noexcept;

  // Lower-case catalog string, e.g. struct<a:bigint,b:array<string>>
  [[nodiscard]] std::string simple_string() const;
  // Upper-case DDL string, e.g. STRUCT<a: BIGINT, b: ARRAY<STRING>>
  [[nodiscard]] std::string sql() const;
};

[[nodiscard]] bool operator==(const NullType &, const NullType &) noexcept;
[[nodiscard]] bool operator==(const BooleanType &, const BooleanType &) noexcept;
[[nodiscard]] bool operator==(const IntegerType &a, const IntegerType &b) noexcept;
[[nodiscard]] bool operator==(const FloatType &a, const FloatType &b) noexcept;
[[nodiscard]] bool operator==(const DecimalType &a, const DecimalType &b) noexcept;
[[nodiscard]] bool operator==(const StringType &, const StringType &) noexcept;
[[nodiscard]] bool operator==(const BinaryType &, const BinaryType &) noexcept;
[[nodiscard]] bool operator==(const DateType &, const DateType &) noexcept;
[[nodiscard]] bool operator==(const TimestampType &a, const TimestampType &b) noexcept;
[[nodiscard]] bool operator==(const DayTimeIntervalType &, const DayTimeIntervalType &) noexcept;
[[nodiscard]] bool operator==(const ArrayType &a, const ArrayType &b) noexcept;
[[nodiscard]] bool operator==(const MapType &a, const MapType &b) noexcept;
[[nodiscard]] bool operator==(const StructField &a, const StructField &b) noexcept;
[[nodiscard]] bool operator==(const StructType &a, const StructType &b) noexcept;
[[nodiscard]] bool operator==(const DataType &a, const DataType &b) noexcept;
[[nodiscard]] bool operator!=(const DataType &a, const DataType &b) noexcept;
[[nodiscard]] bool operator!=(const StructType &a, const StructType &b) noexcept;

// Combine two types observed for the same field into a type compatible with both.
// Throws TypeMergeError when no such type exists. field_path is only used to build
// error messages.
[[nodiscard]] DataType merge_types(const DataType &a, const DataType &b,
                                   std::string_view field_path = "");
[[nodiscard]] StructType merge_types(const StructType &a, const StructType &b,
                                     std::string_view field_path = "");

[[nodiscard]] bool has_null_type(const DataType &type) noexcept;
[[nodiscard]] bool has_null_type(const StructType &type) noexcept;

// Duplicated field names are replaced by name_0, name_1, ... (recursively).
[[nodiscard]] StructType deduplicate_field_names(const StructType &schema);
[[nodiscard]] DataType deduplicate_field_names(const DataType &type);

// Non-struct types are wrapped into a single field named "value".
[[nodiscard]] StructType as_struct(const DataType &type);

[[nodiscard]] std::string quote_identifier_if_needed(std::string_view name);

}  // namespace localtable

#include "../../type_impl.hpp"
