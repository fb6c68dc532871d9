// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/arrow_type.hpp"

#include <arrow/type.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "localtable/common.hpp"
#include "localtable/errors.hpp"
#include "localtable/type.hpp"

namespace localtable {

// NOLINTBEGIN(*-avoid-magic-numbers)
[[nodiscard]] static std::shared_ptr<arrow::DataType> to_arrow_integer_type(
    const IntegerType &type) {
  switch (type.bit_width) {
    case 8:
      return arrow::int8();
    case 16:
      return arrow::int16();
    case 32:
      return arrow::int32();
    case 64:
      return arrow::int64();
    default:
      throw UnsupportedTypeForEncodingError(
          DataType{type}.simple_string(),
          fmt::format(FMT_STRING("invalid integer width {}"), type.bit_width));
  }
}
// NOLINTEND(*-avoid-magic-numbers)

std::shared_ptr<arrow::DataType> to_arrow_type(const DataType &type) {
  return std::visit(
      overloaded{
          [](const NullType &) { return arrow::null(); },
          [](const BooleanType &) { return arrow::boolean(); },
          [](const IntegerType &t) { return to_arrow_integer_type(t); },
          [](const FloatType &t) {
            return t.bit_width == 32 ? arrow::float32() : arrow::float64();  // NOLINT
          },
          [&](const DecimalType &t) {
            if (t.precision < 1 || t.precision > DecimalType::MAX_PRECISION) {
              throw UnsupportedTypeForEncodingError(
                  type.simple_string(),
                  fmt::format(FMT_STRING("precision must be between 1 and {}"),
                              DecimalType::MAX_PRECISION));
            }
            return arrow::decimal128(t.precision, t.scale);
          },
          [](const StringType &) { return arrow::utf8(); },
          [](const BinaryType &) { return arrow::binary(); },
          [](const DateType &) { return arrow::date32(); },
          [](const TimestampType &t) {
            if (t.ntz) {
              return arrow::timestamp(arrow::TimeUnit::MICRO);
            }
            return arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
          },
          [](const DayTimeIntervalType &) { return arrow::duration(arrow::TimeUnit::MICRO); },
          [](const ArrayType &t) {
            return arrow::list(
                arrow::field("element", to_arrow_type(t.element()), t.contains_null));
          },
          [](const MapType &t) {
            return std::static_pointer_cast<arrow::DataType>(std::make_shared<arrow::MapType>(
                arrow::field("key", to_arrow_type(t.key()), false),
                arrow::field("value", to_arrow_type(t.value()), t.value_contains_null)));
          },
          [](const StructType &t) {
            arrow::FieldVector fields{};
            fields.reserve(t.size());
            for (const auto &field : t) {
              fields.emplace_back(to_arrow_field(field));
            }
            return arrow::struct_(fields);
          }},
      type.get());
}

std::shared_ptr<arrow::Field> to_arrow_field(const StructField &field) {
  return arrow::field(field.name, to_arrow_type(field.type()), field.nullable);
}

std::shared_ptr<arrow::Schema> to_arrow_schema(const StructType &schema) {
  const auto dedup_schema = deduplicate_field_names(schema);
  arrow::FieldVector fields{};
  fields.reserve(dedup_schema.size());
  for (const auto &field : dedup_schema) {
    fields.emplace_back(to_arrow_field(field));
  }
  return arrow::schema(std::move(fields));
}

[[nodiscard]] static StructType from_arrow_fields(const arrow::FieldVector &fields) {
  StructType type{};
  for (const auto &field : fields) {
    type.add(field->name(), from_arrow_type(field->type()), field->nullable());
  }
  return type;
}

// NOLINTNEXTLINE(*-function-cognitive-complexity)
DataType from_arrow_type(const std::shared_ptr<arrow::DataType> &type) {
  using T = arrow::Type::type;
  // NOLINTBEGIN(*-avoid-magic-numbers)
  switch (type->id()) {
    case T::NA:
      return NullType{};
    case T::BOOL:
      return BooleanType{};
    case T::INT8:
      return IntegerType{8};
    case T::UINT8:
      [[fallthrough]];
    case T::INT16:
      return IntegerType{16};
    case T::UINT16:
      [[fallthrough]];
    case T::INT32:
      return IntegerType{32};
    case T::UINT32:
      [[fallthrough]];
    case T::INT64:
      return IntegerType{64};
    case T::UINT64:
      return DecimalType{20, 0};
    case T::HALF_FLOAT:
      [[fallthrough]];
    case T::FLOAT:
      return FloatType{32};
    case T::DOUBLE:
      return FloatType{64};
    case T::DECIMAL128:
      [[fallthrough]];
    case T::DECIMAL256: {
      const auto &dtype = static_cast<const arrow::DecimalType &>(*type);
      if (dtype.precision() > DecimalType::MAX_PRECISION) {
        throw UnsupportedTypeForEncodingError(
            type->ToString(), fmt::format(FMT_STRING("precision is greater than {}"),
                                          DecimalType::MAX_PRECISION));
      }
      return DecimalType{dtype.precision(), dtype.scale()};
    }
    case T::STRING:
      [[fallthrough]];
    case T::LARGE_STRING:
      [[fallthrough]];
    case T::STRING_VIEW:
      return StringType{};
    case T::BINARY:
      [[fallthrough]];
    case T::LARGE_BINARY:
      [[fallthrough]];
    case T::BINARY_VIEW:
      [[fallthrough]];
    case T::FIXED_SIZE_BINARY:
      return BinaryType{};
    case T::DATE32:
      [[fallthrough]];
    case T::DATE64:
      return DateType{};
    case T::TIMESTAMP: {
      const auto &dtype = static_cast<const arrow::TimestampType &>(*type);
      return TimestampType{dtype.timezone().empty()};
    }
    case T::DURATION:
      return DayTimeIntervalType{};
    case T::LIST:
      [[fallthrough]];
    case T::LARGE_LIST:
      [[fallthrough]];
    case T::FIXED_SIZE_LIST: {
      const auto &dtype = static_cast<const arrow::BaseListType &>(*type);
      return ArrayType{from_arrow_type(dtype.value_type()), dtype.value_field()->nullable()};
    }
    case T::MAP: {
      const auto &dtype = static_cast<const arrow::MapType &>(*type);
      return MapType{from_arrow_type(dtype.key_type()), from_arrow_type(dtype.item_type()),
                     dtype.item_field()->nullable()};
    }
    case T::STRUCT:
      return from_arrow_fields(type->fields());
    case T::DICTIONARY: {
      const auto &dtype = static_cast<const arrow::DictionaryType &>(*type);
      return from_arrow_type(dtype.value_type());
    }
    default:
      throw UnsupportedTypeForEncodingError(type->ToString());
  }
  // NOLINTEND(*-avoid-magic-numbers)
}

StructType from_arrow_schema(const arrow::Schema &schema) {
  return from_arrow_fields(schema.fields());
}

}  // namespace localtable
