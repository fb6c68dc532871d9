// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/type.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/common.hpp"
#include "localtable/errors.hpp"

namespace localtable {

ArrayType::ArrayType(DataType element, bool contains_null_)
    : element_type(std::make_shared<const DataType>(std::move(element))),
      contains_null(contains_null_) {}

const DataType &ArrayType::element() const noexcept {
  assert(element_type);
  return *element_type;
}

MapType::MapType(DataType key, DataType value, bool value_contains_null_)
    : key_type(std::make_shared<const DataType>(std::move(key))),
      value_type(std::make_shared<const DataType>(std::move(value))),
      value_contains_null(value_contains_null_) {}

const DataType &MapType::key() const noexcept {
  assert(key_type);
  return *key_type;
}

const DataType &MapType::value() const noexcept {
  assert(value_type);
  return *value_type;
}

StructField::StructField(std::string name_, DataType type_, bool nullable_)
    : name(std::move(name_)),
      data_type(std::make_shared<const DataType>(std::move(type_))),
      nullable(nullable_) {}

const DataType &StructField::type() const noexcept {
  assert(data_type);
  return *data_type;
}

StructType::StructType(std::vector<StructField> fields) : _fields(std::move(fields)) {}

StructType &StructType::add(std::string name, DataType type, bool nullable) {
  _fields.emplace_back(std::move(name), std::move(type), nullable);
  return *this;
}

StructType &StructType::add(StructField field) {
  _fields.emplace_back(std::move(field));
  return *this;
}

const std::vector<StructField> &StructType::fields() const noexcept { return _fields; }
std::size_t StructType::size() const noexcept { return _fields.size(); }
bool StructType::empty() const noexcept { return _fields.empty(); }

const StructField &StructType::operator[](std::size_t i) const { return _fields.at(i); }

const StructField *StructType::find(std::string_view name) const noexcept {
  const auto match = std::find_if(_fields.begin(), _fields.end(),
                                  [&](const StructField &f) { return f.name == name; });
  if (match == _fields.end()) {
    return nullptr;
  }
  return &*match;
}

std::vector<std::string> StructType::names() const {
  std::vector<std::string> names_(_fields.size());
  std::transform(_fields.begin(), _fields.end(), names_.begin(),
                 [](const StructField &f) { return f.name; });
  return names_;
}

StructType StructType::rename(const std::vector<std::string> &names) const {
  if (names.size() != _fields.size()) {
    throw AxisLengthMismatchError(static_cast<std::int64_t>(names.size()),
                                  static_cast<std::int64_t>(_fields.size()));
  }

  std::vector<StructField> fields;
  fields.reserve(_fields.size());
  for (std::size_t i = 0; i < _fields.size(); ++i) {
    fields.emplace_back(names[i], _fields[i].type(), _fields[i].nullable);
  }
  return StructType{std::move(fields)};
}

StructType::const_iterator StructType::begin() const noexcept { return _fields.begin(); }
StructType::const_iterator StructType::end() const noexcept { return _fields.end(); }

std::string quote_identifier_if_needed(std::string_view name) {
  auto is_ident_char = [](unsigned char c) { return std::isalnum(c) || c == '_'; };
  const auto plain = !name.empty() && std::all_of(name.begin(), name.end(), is_ident_char) &&
                     !std::isdigit(static_cast<unsigned char>(name.front()));
  if (plain) {
    return std::string{name};
  }

  std::string quoted{"`"};
  for (const auto c : name) {
    if (c == '`') {
      quoted.push_back('`');
    }
    quoted.push_back(c);
  }
  quoted.push_back('`');
  return quoted;
}

std::string StructType::to_ddl() const {
  std::vector<std::string> columns(_fields.size());
  std::transform(_fields.begin(), _fields.end(), columns.begin(), [](const StructField &f) {
    return fmt::format(FMT_STRING("{} {}{}"), quote_identifier_if_needed(f.name), f.type().sql(),
                       f.nullable ? "" : " NOT NULL");
  });
  return fmt::format(FMT_STRING("{}"), fmt::join(columns, ", "));
}

[[nodiscard]] static std::string_view integer_type_name(std::uint8_t bit_width) {
  // NOLINTBEGIN(*-avoid-magic-numbers)
  switch (bit_width) {
    case 8:
      return "tinyint";
    case 16:
      return "smallint";
    case 32:
      return "int";
    case 64:
      return "bigint";
    default:
      throw std::logic_error(fmt::format(FMT_STRING("invalid integer width: {}"), bit_width));
  }
  // NOLINTEND(*-avoid-magic-numbers)
}

[[nodiscard]] static std::string_view float_type_name(std::uint8_t bit_width) {
  // NOLINTBEGIN(*-avoid-magic-numbers)
  switch (bit_width) {
    case 32:
      return "float";
    case 64:
      return "double";
    default:
      throw std::logic_error(fmt::format(FMT_STRING("invalid float width: {}"), bit_width));
  }
  // NOLINTEND(*-avoid-magic-numbers)
}

[[nodiscard]] static std::string to_upper(std::string_view s) {
  std::string res{s};
  std::transform(res.begin(), res.end(), res.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return res;
}

std::string DataType::simple_string() const {
  return std::visit(
      overloaded{
          [](const NullType &) -> std::string { return "void"; },
          [](const BooleanType &) -> std::string { return "boolean"; },
          [](const IntegerType &t) -> std::string {
            return std::string{integer_type_name(t.bit_width)};
          },
          [](const FloatType &t) -> std::string {
            return std::string{float_type_name(t.bit_width)};
          },
          [](const DecimalType &t) -> std::string {
            return fmt::format(FMT_STRING("decimal({},{})"), t.precision, t.scale);
          },
          [](const StringType &) -> std::string { return "string"; },
          [](const BinaryType &) -> std::string { return "binary"; },
          [](const DateType &) -> std::string { return "date"; },
          [](const TimestampType &t) -> std::string {
            return t.ntz ? "timestamp_ntz" : "timestamp";
          },
          [](const DayTimeIntervalType &) -> std::string { return "interval day to second"; },
          [](const ArrayType &t) -> std::string {
            return fmt::format(FMT_STRING("array<{}>"), t.element().simple_string());
          },
          [](const MapType &t) -> std::string {
            return fmt::format(FMT_STRING("map<{},{}>"), t.key().simple_string(),
                               t.value().simple_string());
          },
          [](const StructType &t) -> std::string {
            std::vector<std::string> fields(t.size());
            std::transform(t.begin(), t.end(), fields.begin(), [](const StructField &f) {
              return fmt::format(FMT_STRING("{}:{}"), f.name, f.type().simple_string());
            });
            return fmt::format(FMT_STRING("struct<{}>"), fmt::join(fields, ","));
          }},
      _type);
}

std::string DataType::sql() const {
  return std::visit(
      overloaded{
          [](const ArrayType &t) -> std::string {
            return fmt::format(FMT_STRING("ARRAY<{}>"), t.element().sql());
          },
          [](const MapType &t) -> std::string {
            return fmt::format(FMT_STRING("MAP<{}, {}>"), t.key().sql(), t.value().sql());
          },
          [](const StructType &t) -> std::string {
            std::vector<std::string> fields(t.size());
            std::transform(t.begin(), t.end(), fields.begin(), [](const StructField &f) {
              return fmt::format(FMT_STRING("{}: {}{}"), quote_identifier_if_needed(f.name),
                                 f.type().sql(), f.nullable ? "" : " NOT NULL");
            });
            return fmt::format(FMT_STRING("STRUCT<{}>"), fmt::join(fields, ", "));
          },
          [this](const auto &) -> std::string { return to_upper(simple_string()); }},
      _type);
}

bool operator==(const NullType &, const NullType &) noexcept { return true; }
bool operator==(const BooleanType &, const BooleanType &) noexcept { return true; }
bool operator==(const IntegerType &a, const IntegerType &b) noexcept {
  return a.bit_width == b.bit_width;
}
bool operator==(const FloatType &a, const FloatType &b) noexcept {
  return a.bit_width == b.bit_width;
}
bool operator==(const DecimalType &a, const DecimalType &b) noexcept {
  return a.precision == b.precision && a.scale == b.scale;
}
bool operator==(const StringType &, const StringType &) noexcept { return true; }
bool operator==(const BinaryType &, const BinaryType &) noexcept { return true; }
bool operator==(const DateType &, const DateType &) noexcept { return true; }
bool operator==(const TimestampType &a, const TimestampType &b) noexcept {
  return a.ntz == b.ntz;
}
bool operator==(const DayTimeIntervalType &, const DayTimeIntervalType &) noexcept {
  return true;
}
bool operator==(const ArrayType &a, const ArrayType &b) noexcept {
  return a.contains_null == b.contains_null && a.element() == b.element();
}
bool operator==(const MapType &a, const MapType &b) noexcept {
  return a.value_contains_null == b.value_contains_null && a.key() == b.key() &&
         a.value() == b.value();
}
bool operator==(const StructField &a, const StructField &b) noexcept {
  return a.name == b.name && a.nullable == b.nullable && a.type() == b.type();
}
bool operator==(const StructType &a, const StructType &b) noexcept {
  return a.fields() == b.fields();
}
bool operator==(const DataType &a, const DataType &b) noexcept { return a.get() == b.get(); }
bool operator!=(const DataType &a, const DataType &b) noexcept { return !(a == b); }
bool operator!=(const StructType &a, const StructType &b) noexcept { return !(a == b); }

[[nodiscard]] static std::string nested_field_path(std::string_view parent,
                                                   std::string_view child) {
  if (parent.empty()) {
    return fmt::format(FMT_STRING("field {}"), child);
  }
  return fmt::format(FMT_STRING("field {} in {}"), child, parent);
}

[[nodiscard]] static std::string nested_path(std::string_view what, std::string_view parent) {
  if (parent.empty()) {
    return std::string{what};
  }
  return fmt::format(FMT_STRING("{} of {}"), what, parent);
}

// Number of decimal digits needed to hold any integer of the given width
[[nodiscard]] static std::int32_t integer_decimal_digits(std::int32_t bit_width) {
  // NOLINTBEGIN(*-avoid-magic-numbers)
  switch (bit_width) {
    case 8:
      return 3;
    case 16:
      return 5;
    case 32:
      return 10;
    default:
      return 20;
  }
  // NOLINTEND(*-avoid-magic-numbers)
}

[[nodiscard]] static DataType merge_numeric_types(const DataType &a, const DataType &b,
                                                  std::string_view field_path) {
  // NOLINTBEGIN(*-avoid-magic-numbers)
  if (a.is<IntegerType>() && b.is<IntegerType>()) {
    return IntegerType{std::max(a.get<IntegerType>().bit_width, b.get<IntegerType>().bit_width)};
  }
  if (a.is<FloatType>() && b.is<FloatType>()) {
    return FloatType{std::max(a.get<FloatType>().bit_width, b.get<FloatType>().bit_width)};
  }
  if (a.is<DecimalType>() && b.is<DecimalType>()) {
    const auto &da = a.get<DecimalType>();
    const auto &db = b.get<DecimalType>();
    const auto scale = std::max(da.scale, db.scale);
    const auto integral_digits = std::max(da.precision - da.scale, db.precision - db.scale);
    return DecimalType{std::min(DecimalType::MAX_PRECISION, integral_digits + scale), scale};
  }
  if (a.is<IntegerType>() && b.is<FloatType>()) {
    const auto int_width = a.get<IntegerType>().bit_width;
    const auto float_width = b.get<FloatType>().bit_width;
    if (float_width == 32 && int_width <= 16) {
      return FloatType{32};
    }
    return FloatType{64};
  }
  if (a.is<IntegerType>() && b.is<DecimalType>()) {
    const auto &d = b.get<DecimalType>();
    const auto integral_digits =
        std::max(d.precision - d.scale, integer_decimal_digits(a.get<IntegerType>().bit_width));
    return DecimalType{std::min(DecimalType::MAX_PRECISION, integral_digits + d.scale), d.scale};
  }
  if (a.is<DecimalType>() && b.is<FloatType>()) {
    return FloatType{64};
  }
  if ((a.is<FloatType>() && b.is<IntegerType>()) || (a.is<DecimalType>() && b.is<IntegerType>()) ||
      (a.is<FloatType>() && b.is<DecimalType>())) {
    return merge_numeric_types(b, a, field_path);
  }
  // NOLINTEND(*-avoid-magic-numbers)

  throw TypeMergeError(a, b, field_path);
}

StructType merge_types(const StructType &a, const StructType &b, std::string_view field_path) {
  std::vector<StructField> fields;
  fields.reserve(a.size() + b.size());

  for (const auto &field : a) {
    if (const auto *other = b.find(field.name); other) {
      fields.emplace_back(field.name,
                          merge_types(field.type(), other->type(),
                                      nested_field_path(field_path, field.name)),
                          field.nullable || other->nullable);
    } else {
      fields.emplace_back(field.name, field.type(), true);
    }
  }

  for (const auto &field : b) {
    if (!a.find(field.name)) {
      fields.emplace_back(field.name, field.type(), true);
    }
  }

  return StructType{std::move(fields)};
}

DataType merge_types(const DataType &a, const DataType &b, std::string_view field_path) {
  if (a == b) {
    return a;
  }
  if (a.is_null()) {
    return b;
  }
  if (b.is_null()) {
    return a;
  }
  if (a.is<TimestampType>() && b.is<TimestampType>()) {
    return TimestampType{false};
  }
  if (a.is_numeric() && b.is_numeric()) {
    return merge_numeric_types(a, b, field_path);
  }
  if (a.id() != b.id()) {
    throw TypeMergeError(a, b, field_path);
  }

  switch (a.id()) {
    case TypeId::STRUCT:
      return merge_types(a.get<StructType>(), b.get<StructType>(), field_path);
    case TypeId::ARRAY:
      return ArrayType{merge_types(a.get<ArrayType>().element(), b.get<ArrayType>().element(),
                                   nested_path("element in array", field_path)),
                       true};
    case TypeId::MAP:
      return MapType{merge_types(a.get<MapType>().key(), b.get<MapType>().key(),
                                 nested_path("key of map", field_path)),
                     merge_types(a.get<MapType>().value(), b.get<MapType>().value(),
                                 nested_path("value of map", field_path)),
                     true};
    default:
      // same atomic type with different parameters
      throw TypeMergeError(a, b, field_path);
  }
}

bool has_null_type(const StructType &type) noexcept {
  return std::any_of(type.begin(), type.end(),
                     [](const StructField &f) { return has_null_type(f.type()); });
}

bool has_null_type(const DataType &type) noexcept {
  switch (type.id()) {
    case TypeId::NULL_TYPE:
      return true;
    case TypeId::ARRAY:
      return has_null_type(type.get<ArrayType>().element());
    case TypeId::MAP:
      return has_null_type(type.get<MapType>().key()) ||
             has_null_type(type.get<MapType>().value());
    case TypeId::STRUCT:
      return has_null_type(type.get<StructType>());
    default:
      return false;
  }
}

[[nodiscard]] static std::vector<std::string> deduplicate_names(
    const std::vector<std::string> &names) {
  phmap::flat_hash_map<std::string_view, std::size_t> occurrences(names.size());
  for (const auto &name : names) {
    ++occurrences[name];
  }

  if (occurrences.size() == names.size()) {
    return names;
  }

  phmap::flat_hash_map<std::string_view, std::size_t> counters{};
  std::vector<std::string> deduped;
  deduped.reserve(names.size());
  for (const auto &name : names) {
    if (occurrences[name] > 1) {
      deduped.emplace_back(fmt::format(FMT_STRING("{}_{}"), name, counters[name]++));
    } else {
      deduped.emplace_back(name);
    }
  }
  return deduped;
}

StructType deduplicate_field_names(const StructType &schema) {
  const auto names = deduplicate_names(schema.names());

  std::vector<StructField> fields;
  fields.reserve(schema.size());
  for (std::size_t i = 0; i < schema.size(); ++i) {
    fields.emplace_back(names[i], deduplicate_field_names(schema[i].type()), schema[i].nullable);
  }
  return StructType{std::move(fields)};
}

DataType deduplicate_field_names(const DataType &type) {
  switch (type.id()) {
    case TypeId::STRUCT:
      return deduplicate_field_names(type.get<StructType>());
    case TypeId::ARRAY: {
      const auto &t = type.get<ArrayType>();
      return ArrayType{deduplicate_field_names(t.element()), t.contains_null};
    }
    case TypeId::MAP: {
      const auto &t = type.get<MapType>();
      return MapType{deduplicate_field_names(t.key()), deduplicate_field_names(t.value()),
                     t.value_contains_null};
    }
    default:
      return type;
  }
}

StructType as_struct(const DataType &type) {
  if (type.is_struct()) {
    return type.get<StructType>();
  }
  return StructType{}.add("value", type, true);
}

}  // namespace localtable
