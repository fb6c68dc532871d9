// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "localtable/type.hpp"

namespace localtable {

class LocalTableError : public std::invalid_argument {
  std::string_view _error_class;

 public:
  LocalTableError(std::string_view error_class, std::string_view msg);
  [[nodiscard]] std::string_view error_class() const noexcept;
};

class EmptyInputError : public LocalTableError {
 public:
  EmptyInputError();
};

class InvalidRankError : public LocalTableError {
  std::int64_t _rank{};

 public:
  explicit InvalidRankError(std::int64_t rank);
  [[nodiscard]] std::int64_t rank() const noexcept;
};

class AxisLengthMismatchError : public LocalTableError {
  std::int64_t _expected{};
  std::int64_t _actual{};

 public:
  AxisLengthMismatchError(std::int64_t expected, std::int64_t actual);
  [[nodiscard]] std::int64_t expected() const noexcept;
  [[nodiscard]] std::int64_t actual() const noexcept;
};

class TypeMergeError : public LocalTableError {
  DataType _first;
  DataType _second;
  std::string _field_path;

 public:
  TypeMergeError(DataType first, DataType second, std::string_view field_path = "");
  [[nodiscard]] const DataType &first() const noexcept;
  [[nodiscard]] const DataType &second() const noexcept;
  [[nodiscard]] std::string_view field_path() const noexcept;
};

class UnresolvedTypeError : public LocalTableError {
 public:
  explicit UnresolvedTypeError(const StructType &inferred_schema);
};

class InvalidInputTypeError : public LocalTableError {
 public:
  InvalidInputTypeError(std::string_view arg_name, std::string_view data_type);
};

class UnsupportedTypeForEncodingError : public LocalTableError {
 public:
  explicit UnsupportedTypeForEncodingError(std::string_view data_type,
                                           std::string_view reason = "");
};

class ValueConversionError : public LocalTableError {
 public:
  ValueConversionError(std::string_view field_path, std::string_view reason);
};

class DdlParseError : public LocalTableError {
  std::size_t _position{};

 public:
  DdlParseError(std::string_view ddl, std::size_t position, std::string_view reason);
  [[nodiscard]] std::size_t position() const noexcept;
};

}  // namespace localtable
