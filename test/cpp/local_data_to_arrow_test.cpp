// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/local_data_to_arrow.hpp"

#include <arrow/array.h>
#include <arrow/table.h>
#include <arrow/type.h>

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "localtable/errors.hpp"
#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable::test {

template <typename ArrayT>
[[nodiscard]] static std::shared_ptr<ArrayT> get_column(const arrow::Table &table, int i) {
  REQUIRE(table.column(i)->num_chunks() == 1);
  return std::static_pointer_cast<ArrayT>(table.column(i)->chunk(0));
}

// NOLINTBEGIN(*-avoid-magic-numbers, readability-function-cognitive-complexity)
TEST_CASE("LocalDataToArrowConversion: record shapes", "[conversion][short]") {
  const auto schema = StructType{}.add("name", StringType{}).add("age", IntegerType{32});

  SECTION("maps") {
    const auto table = LocalDataToArrowConversion::convert(
        {Value::map({{"age", 30}, {"name", "Alice"}}), Value::map({{"name", "Bob"}})}, schema);
    REQUIRE(table->num_rows() == 2);
    REQUIRE(table->num_columns() == 2);
    CHECK(table->schema()->field(1)->type()->Equals(*arrow::int32()));

    const auto names = get_column<arrow::StringArray>(*table, 0);
    const auto ages = get_column<arrow::Int32Array>(*table, 1);
    CHECK(names->GetString(0) == "Alice");
    CHECK(names->GetString(1) == "Bob");
    CHECK(ages->Value(0) == 30);
    CHECK(ages->IsNull(1));
  }

  SECTION("named rows are looked up by name") {
    const auto table =
        LocalDataToArrowConversion::convert({Value::row({"age", "name"}, {30, "Alice"})}, schema);
    CHECK(get_column<arrow::StringArray>(*table, 0)->GetString(0) == "Alice");
    CHECK(get_column<arrow::Int32Array>(*table, 1)->Value(0) == 30);
  }

  SECTION("named rows with foreign names are looked up by position") {
    const auto table =
        LocalDataToArrowConversion::convert({Value::row({"a", "b"}, {"Alice", 30})}, schema);
    CHECK(get_column<arrow::StringArray>(*table, 0)->GetString(0) == "Alice");
    CHECK(get_column<arrow::Int32Array>(*table, 1)->Value(0) == 30);
  }

  SECTION("objects") {
    const auto table = LocalDataToArrowConversion::convert(
        {Value::object({{"age", 30}, {"name", "Alice"}})}, schema);
    CHECK(get_column<arrow::StringArray>(*table, 0)->GetString(0) == "Alice");
    CHECK(get_column<arrow::Int32Array>(*table, 1)->Value(0) == 30);
  }

  SECTION("short positional records are padded with nulls") {
    const auto table = LocalDataToArrowConversion::convert(
        {Value::list({"Alice"}), Value::tuple({"Bob", 25})}, schema);
    REQUIRE(table->num_rows() == 2);
    const auto ages = get_column<arrow::Int32Array>(*table, 1);
    CHECK(ages->IsNull(0));
    CHECK(ages->Value(1) == 25);
  }

  SECTION("long positional records") {
    CHECK_THROWS_AS(
        LocalDataToArrowConversion::convert({Value::tuple({"Alice", 30, true})}, schema),
        ValueConversionError);
  }

  SECTION("no records") {
    const auto table = LocalDataToArrowConversion::convert({}, schema);
    CHECK(table->num_rows() == 0);
    CHECK(table->num_columns() == 2);
  }
}

TEST_CASE("LocalDataToArrowConversion: value coercion", "[conversion][short]") {
  SECTION("integer overflow") {
    const auto schema = StructType{}.add("x", IntegerType{8});
    CHECK_THROWS_AS(LocalDataToArrowConversion::convert({Value::tuple({1000})}, schema),
                    ValueConversionError);
  }

  SECTION("integers to floating point") {
    const auto schema = StructType{}.add("x", FloatType{64});
    const auto table =
        LocalDataToArrowConversion::convert({Value::tuple({1}), Value::tuple({2.5})}, schema);
    const auto col = get_column<arrow::DoubleArray>(*table, 0);
    CHECK(col->Value(0) == 1.0);
    CHECK(col->Value(1) == 2.5);
  }

  SECTION("floating point to integers") {
    const auto schema = StructType{}.add("x", IntegerType{64});
    CHECK_THROWS_AS(LocalDataToArrowConversion::convert({Value::tuple({2.5})}, schema),
                    ValueConversionError);
  }

  SECTION("decimals are rescaled") {
    const auto schema = StructType{}.add("x", DecimalType{10, 3});
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::decimal("1.5")}), Value::tuple({2})}, schema);
    const auto col = get_column<arrow::Decimal128Array>(*table, 0);
    CHECK(col->FormatValue(0) == "1.500");
    CHECK(col->FormatValue(1) == "2.000");
  }

  SECTION("decimals exceeding precision") {
    const auto schema = StructType{}.add("x", DecimalType{3, 2});
    CHECK_THROWS_AS(
        LocalDataToArrowConversion::convert({Value::tuple({Value::decimal("123.45")})}, schema),
        ValueConversionError);
  }

  SECTION("strings") {
    const auto schema = StructType{}.add("x", StringType{});
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({"a"}), Value::tuple({true}), Value::tuple({12})}, schema);
    const auto col = get_column<arrow::StringArray>(*table, 0);
    CHECK(col->GetString(0) == "a");
    CHECK(col->GetString(1) == "true");
    CHECK(col->GetString(2) == "12");
  }

  SECTION("temporal values") {
    const auto schema = StructType{}
                            .add("d", DateType{})
                            .add("ts", TimestampType{false})
                            .add("delta", DayTimeIntervalType{});
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::date(19'000), Value::timestamp(1'000'000, true),
                       Value::interval(5'000'000)})},
        schema);
    CHECK(get_column<arrow::Date32Array>(*table, 0)->Value(0) == 19'000);
    CHECK(get_column<arrow::TimestampArray>(*table, 1)->Value(0) == 1'000'000);
    CHECK(get_column<arrow::DurationArray>(*table, 2)->Value(0) == 5'000'000);
  }

  SECTION("decimals to floating point") {
    const auto schema = StructType{}.add("x", FloatType{64});
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::decimal("1.5")}), Value::tuple({2.0})}, schema);
    const auto col = get_column<arrow::DoubleArray>(*table, 0);
    CHECK(col->Value(0) == 1.5);
    CHECK(col->Value(1) == 2.0);
  }

  SECTION("mismatched types") {
    const auto schema = StructType{}.add("x", BooleanType{});
    try {
      std::ignore = LocalDataToArrowConversion::convert({Value::tuple({"yes"})}, schema);
      FAIL("expected a ValueConversionError");
    } catch (const ValueConversionError &e) {
      CHECK(e.error_class() == "CANNOT_CONVERT_VALUE");
      CHECK(std::string{e.what()}.find("x: cannot convert") != std::string::npos);
    }
  }
}

TEST_CASE("LocalDataToArrowConversion: nested values", "[conversion][short]") {
  SECTION("arrays") {
    const auto schema = StructType{}.add("xs", ArrayType{IntegerType{}});
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::list({1, 2, Value::null()})}), Value::tuple({Value::list({})})},
        schema);
    const auto col = get_column<arrow::ListArray>(*table, 0);
    CHECK(col->value_length(0) == 3);
    CHECK(col->value_length(1) == 0);
    CHECK(col->values()->IsNull(2));
  }

  SECTION("maps") {
    const auto schema = StructType{}.add("m", MapType{StringType{}, IntegerType{}});
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::map({{"a", 1}, {"b", 2}})})}, schema);
    const auto col = get_column<arrow::MapArray>(*table, 0);
    CHECK(col->value_length(0) == 2);
    CHECK(std::static_pointer_cast<arrow::StringArray>(col->keys())->GetString(1) == "b");

    CHECK_THROWS_AS(LocalDataToArrowConversion::convert(
                        {Value::tuple({Value::map({{Value::null(), 1}})})}, schema),
                    ValueConversionError);
  }

  SECTION("structs") {
    const auto inner = StructType{}.add("a", IntegerType{}).add("b", StringType{});
    const auto schema = StructType{}.add("s", inner);
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::map({{"b", "x"}, {"a", 1}})}), Value::tuple({Value::null()})},
        schema);
    const auto col = get_column<arrow::StructArray>(*table, 0);
    CHECK(col->IsValid(0));
    CHECK(col->IsNull(1));
    CHECK(std::static_pointer_cast<arrow::Int64Array>(col->field(0))->Value(0) == 1);
    CHECK(std::static_pointer_cast<arrow::StringArray>(col->field(1))->GetString(0) == "x");
  }
}
TEST_CASE("LocalDataToArrowConversion: session timezone", "[conversion][short]") {
  constexpr std::int64_t noon_utc{1'704'110'400'000'000};  // 2024-01-01T12:00:00Z
  constexpr std::int64_t one_hour{3'600'000'000};
  const auto schema =
      StructType{}.add("ltz", TimestampType{false}).add("ntz", TimestampType{true});

  SECTION("UTC keeps the values") {
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::timestamp(noon_utc, false), Value::timestamp(noon_utc, true)})},
        schema);
    CHECK(get_column<arrow::TimestampArray>(*table, 0)->Value(0) == noon_utc);
    CHECK(get_column<arrow::TimestampArray>(*table, 1)->Value(0) == noon_utc);
  }

  SECTION("aware values into timestamp_ntz become wall-clock times") {
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::timestamp(noon_utc, true), Value::timestamp(noon_utc, true)})},
        schema, "+01:00");
    CHECK(get_column<arrow::TimestampArray>(*table, 0)->Value(0) == noon_utc);
    CHECK(get_column<arrow::TimestampArray>(*table, 1)->Value(0) == noon_utc + one_hour);
  }

  SECTION("naive values into timestamp are localized") {
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::timestamp(noon_utc, false), Value::timestamp(noon_utc, false)})},
        schema, "+01:00");
    CHECK(get_column<arrow::TimestampArray>(*table, 0)->Value(0) == noon_utc - one_hour);
    CHECK(get_column<arrow::TimestampArray>(*table, 1)->Value(0) == noon_utc);
  }

  SECTION("dates") {
    constexpr std::int32_t day{19'723};  // 2024-01-01
    const auto date_schema = StructType{}.add("ltz", TimestampType{false}).add("d", DateType{});
    const auto late_evening_utc = noon_utc + 11 * one_hour + one_hour / 2;
    const auto table = LocalDataToArrowConversion::convert(
        {Value::tuple({Value::date(day), Value::timestamp(late_evening_utc, true)})},
        date_schema, "+01:00");
    CHECK(get_column<arrow::TimestampArray>(*table, 0)->Value(0) ==
          std::int64_t{day} * 24 * one_hour - one_hour);
    CHECK(get_column<arrow::Date32Array>(*table, 1)->Value(0) == day + 1);
  }

  SECTION("invalid timezone") {
    CHECK_THROWS_AS(LocalDataToArrowConversion::convert(
                        {Value::tuple({Value::timestamp(noon_utc, true)})},
                        StructType{}.add("ntz", TimestampType{true}), "Not/A_Zone"),
                    ValueConversionError);
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-function-cognitive-complexity)

}  // namespace localtable::test
