// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/errors.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "localtable/type.hpp"

namespace localtable {

[[nodiscard]] static std::string format_error(std::string_view error_class, std::string_view msg) {
  return fmt::format(FMT_STRING("[{}] {}"), error_class, msg);
}

LocalTableError::LocalTableError(std::string_view error_class, std::string_view msg)
    : std::invalid_argument(format_error(error_class, msg)), _error_class(error_class) {}

std::string_view LocalTableError::error_class() const noexcept { return _error_class; }

EmptyInputError::EmptyInputError()
    : LocalTableError("CANNOT_INFER_EMPTY_SCHEMA", "Can not infer schema from empty dataset.") {}

InvalidRankError::InvalidRankError(std::int64_t rank)
    : LocalTableError(
          "INVALID_NDARRAY_DIMENSION",
          fmt::format(FMT_STRING("NumPy array input should be of 1 or 2 dimensions, found {}."),
                      rank)),
      _rank(rank) {}

std::int64_t InvalidRankError::rank() const noexcept { return _rank; }

AxisLengthMismatchError::AxisLengthMismatchError(std::int64_t expected, std::int64_t actual)
    : LocalTableError("AXIS_LENGTH_MISMATCH",
                      fmt::format(FMT_STRING("Length mismatch: Expected axis has {} element(s), "
                                             "new values have {} element(s)."),
                                  expected, actual)),
      _expected(expected),
      _actual(actual) {}

std::int64_t AxisLengthMismatchError::expected() const noexcept { return _expected; }
std::int64_t AxisLengthMismatchError::actual() const noexcept { return _actual; }

[[nodiscard]] static std::string format_merge_error(const DataType &first, const DataType &second,
                                                    std::string_view field_path) {
  if (field_path.empty()) {
    return fmt::format(FMT_STRING("Can not merge type {} and {}."), first.simple_string(),
                       second.simple_string());
  }
  return fmt::format(FMT_STRING("{}: Can not merge type {} and {}."), field_path,
                     first.simple_string(), second.simple_string());
}

TypeMergeError::TypeMergeError(DataType first, DataType second, std::string_view field_path)
    : LocalTableError("CANNOT_MERGE_TYPE", format_merge_error(first, second, field_path)),
      _first(std::move(first)),
      _second(std::move(second)),
      _field_path(field_path) {}

const DataType &TypeMergeError::first() const noexcept { return _first; }
const DataType &TypeMergeError::second() const noexcept { return _second; }
std::string_view TypeMergeError::field_path() const noexcept { return _field_path; }

UnresolvedTypeError::UnresolvedTypeError(const StructType &inferred_schema)
    : LocalTableError(
          "CANNOT_DETERMINE_TYPE",
          fmt::format(FMT_STRING("Some of types cannot be determined after inferring ({}), "
                                 "a StructType Schema is required in this case."),
                      DataType{inferred_schema}.simple_string())) {}

InvalidInputTypeError::InvalidInputTypeError(std::string_view arg_name,
                                             std::string_view data_type)
    : LocalTableError("INVALID_TYPE",
                      fmt::format(FMT_STRING("Argument `{}` should not be a {}."), arg_name,
                                  data_type)) {}

[[nodiscard]] static std::string format_unsupported_type(std::string_view data_type,
                                                         std::string_view reason) {
  if (reason.empty()) {
    return fmt::format(FMT_STRING("Data type {} is not supported with Arrow."), data_type);
  }
  return fmt::format(FMT_STRING("Data type {} is not supported with Arrow: {}"), data_type,
                     reason);
}

UnsupportedTypeForEncodingError::UnsupportedTypeForEncodingError(std::string_view data_type,
                                                                 std::string_view reason)
    : LocalTableError("UNSUPPORTED_DATA_TYPE_FOR_ARROW",
                      format_unsupported_type(data_type, reason)) {}

ValueConversionError::ValueConversionError(std::string_view field_path, std::string_view reason)
    : LocalTableError("CANNOT_CONVERT_VALUE",
                      fmt::format(FMT_STRING("{}: {}"), field_path, reason)) {}

DdlParseError::DdlParseError(std::string_view ddl, std::size_t position, std::string_view reason)
    : LocalTableError("PARSE_SYNTAX_ERROR",
                      fmt::format(FMT_STRING("{} at position {} of \"{}\"."), reason, position,
                                  ddl)),
      _position(position) {}

std::size_t DdlParseError::position() const noexcept { return _position; }

}  // namespace localtable
