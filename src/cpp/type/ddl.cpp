// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/ddl.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

#include "localtable/errors.hpp"
#include "localtable/type.hpp"

namespace localtable {

namespace {

class DdlParser {
  std::string_view _ddl;
  std::size_t _pos{};

 public:
  explicit DdlParser(std::string_view ddl) noexcept : _ddl(ddl) {}

  [[nodiscard]] StructType table_schema() {
    StructType schema{};
    do {
      schema.add(field(false));
    } while (consume(','));
    expect_end();
    return schema;
  }

  [[nodiscard]] DataType single_type() {
    auto type = data_type();
    expect_end();
    return type;
  }

 private:
  [[noreturn]] void fail(std::string_view reason) const {
    throw DdlParseError(_ddl, _pos, reason);
  }

  void skip_whitespace() noexcept {
    while (_pos < _ddl.size() && std::isspace(static_cast<unsigned char>(_ddl[_pos]))) {
      ++_pos;
    }
  }

  [[nodiscard]] bool at_end() noexcept {
    skip_whitespace();
    return _pos == _ddl.size();
  }

  [[nodiscard]] bool peek(char c) noexcept { return !at_end() && _ddl[_pos] == c; }

  [[nodiscard]] bool consume(char c) noexcept {
    if (peek(c)) {
      ++_pos;
      return true;
    }
    return false;
  }

  void expect(char c) {
    if (!consume(c)) {
      fail(fmt::format(FMT_STRING("expected '{}'"), c));
    }
  }

  void expect_end() {
    if (!at_end()) {
      fail(fmt::format(FMT_STRING("unexpected input \"{}\""), _ddl.substr(_pos)));
    }
  }

  [[nodiscard]] static bool is_word_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  }

  [[nodiscard]] std::string word() {
    skip_whitespace();
    const auto start = _pos;
    while (_pos < _ddl.size() && is_word_char(_ddl[_pos])) {
      ++_pos;
    }
    if (start == _pos) {
      fail("expected an identifier");
    }
    return std::string{_ddl.substr(start, _pos - start)};
  }

  [[nodiscard]] std::string keyword() {
    auto w = word();
    std::transform(w.begin(), w.end(), w.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return w;
  }

  // Case-insensitive lookahead for a keyword, consumed only on match.
  [[nodiscard]] bool consume_keyword(std::string_view kw) {
    skip_whitespace();
    const auto start = _pos;
    if (_pos >= _ddl.size() || !is_word_char(_ddl[_pos])) {
      return false;
    }
    if (keyword() == kw) {
      return true;
    }
    _pos = start;
    return false;
  }

  [[nodiscard]] std::string identifier() {
    skip_whitespace();
    if (_pos < _ddl.size() && _ddl[_pos] == '`') {
      ++_pos;
      std::string name{};
      while (_pos < _ddl.size()) {
        const auto c = _ddl[_pos++];
        if (c != '`') {
          name.push_back(c);
          continue;
        }
        if (_pos < _ddl.size() && _ddl[_pos] == '`') {
          name.push_back('`');
          ++_pos;
          continue;
        }
        return name;
      }
      fail("unterminated quoted identifier");
    }
    return word();
  }

  [[nodiscard]] std::int32_t integer() {
    skip_whitespace();
    std::int32_t n{};
    const auto *first = _ddl.data() + _pos;        // NOLINT(*-pointer-arithmetic)
    const auto *last = _ddl.data() + _ddl.size();  // NOLINT(*-pointer-arithmetic)
    const auto [ptr, ec] = std::from_chars(first, last, n);
    if (ec != std::errc{}) {
      fail("expected an integer");
    }
    _pos += static_cast<std::size_t>(ptr - first);
    return n;
  }

  void string_literal() {
    skip_whitespace();
    if (_pos >= _ddl.size() || (_ddl[_pos] != '\'' && _ddl[_pos] != '"')) {
      fail("expected a string literal");
    }
    const auto quote = _ddl[_pos++];
    while (_pos < _ddl.size()) {
      const auto c = _ddl[_pos++];
      if (c == '\\') {
        ++_pos;
        continue;
      }
      if (c == quote) {
        return;
      }
    }
    fail("unterminated string literal");
  }

  [[nodiscard]] StructField field(bool allow_colon) {
    auto name = identifier();
    if (allow_colon) {
      std::ignore = consume(':');
    }
    auto type = data_type();

    bool nullable = true;
    if (consume_keyword("not")) {
      if (!consume_keyword("null")) {
        fail("expected NULL after NOT");
      }
      nullable = false;
    }
    if (consume_keyword("comment")) {
      string_literal();
    }
    return StructField{std::move(name), std::move(type), nullable};
  }

  [[nodiscard]] DecimalType decimal_type() {
    DecimalType type{};
    if (consume('(')) {
      type.precision = integer();
      type.scale = consume(',') ? integer() : 0;
      expect(')');
    }
    if (type.precision < 1 || type.precision > DecimalType::MAX_PRECISION) {
      fail(fmt::format(FMT_STRING("decimal precision {} is out of range [1, {}]"),
                       type.precision, DecimalType::MAX_PRECISION));
    }
    if (type.scale < 0 || type.scale > type.precision) {
      fail(fmt::format(FMT_STRING("decimal scale {} is out of range [0, {}]"), type.scale,
                       type.precision));
    }
    return type;
  }

  [[nodiscard]] DataType struct_type() {
    expect('<');
    StructType type{};
    if (consume('>')) {
      return type;
    }
    do {
      type.add(field(true));
    } while (consume(','));
    expect('>');
    return type;
  }

  // NOLINTNEXTLINE(*-function-cognitive-complexity)
  [[nodiscard]] DataType data_type() {
    const auto start = _pos;
    const auto name = keyword();

    // NOLINTBEGIN(*-avoid-magic-numbers)
    if (name == "void" || name == "null") {
      return NullType{};
    }
    if (name == "boolean" || name == "bool") {
      return BooleanType{};
    }
    if (name == "tinyint" || name == "byte") {
      return IntegerType{8};
    }
    if (name == "smallint" || name == "short") {
      return IntegerType{16};
    }
    if (name == "int" || name == "integer") {
      return IntegerType{32};
    }
    if (name == "bigint" || name == "long") {
      return IntegerType{64};
    }
    if (name == "float" || name == "real") {
      return FloatType{32};
    }
    if (name == "double") {
      return FloatType{64};
    }
    // NOLINTEND(*-avoid-magic-numbers)
    if (name == "decimal" || name == "dec" || name == "numeric") {
      return decimal_type();
    }
    if (name == "string") {
      return StringType{};
    }
    if (name == "varchar" || name == "char") {
      expect('(');
      std::ignore = integer();
      expect(')');
      return StringType{};
    }
    if (name == "binary") {
      return BinaryType{};
    }
    if (name == "date") {
      return DateType{};
    }
    if (name == "timestamp" || name == "timestamp_ltz") {
      return TimestampType{false};
    }
    if (name == "timestamp_ntz") {
      return TimestampType{true};
    }
    if (name == "interval") {
      if (consume_keyword("day") && consume_keyword("to") && consume_keyword("second")) {
        return DayTimeIntervalType{};
      }
      fail("only INTERVAL DAY TO SECOND is supported");
    }
    if (name == "array") {
      expect('<');
      auto element = data_type();
      expect('>');
      return ArrayType{std::move(element), true};
    }
    if (name == "map") {
      expect('<');
      auto key = data_type();
      expect(',');
      auto value = data_type();
      expect('>');
      return MapType{std::move(key), std::move(value), true};
    }
    if (name == "struct") {
      return struct_type();
    }

    _pos = start;
    skip_whitespace();
    fail(fmt::format(FMT_STRING("unknown data type \"{}\""), name));
  }
};

}  // namespace

StructType parse_table_schema(std::string_view ddl) { return DdlParser{ddl}.table_schema(); }

DataType parse_data_type(std::string_view ddl) { return DdlParser{ddl}.single_type(); }

DataType parse_ddl(std::string_view ddl) {
  try {
    return parse_table_schema(ddl);
  } catch (const DdlParseError &schema_error) {
    SPDLOG_DEBUG(FMT_STRING("failed to parse \"{}\" as a table schema: {}"), ddl,
                 schema_error.what());
    try {
      return parse_data_type(ddl);
    } catch (const DdlParseError &type_error) {
      // report the attempt that made it further into the input
      if (type_error.position() >= schema_error.position()) {
        throw;
      }
      throw schema_error;  // NOLINT(*-exception-copy-constructor-throws)
    }
  }
}

}  // namespace localtable
