// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/type.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <string>
#include <tuple>
#include <vector>

#include "localtable/errors.hpp"

namespace localtable::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-function-cognitive-complexity)
TEST_CASE("localtable::DataType: strings", "[type][short]") {
  SECTION("atomic types") {
    CHECK(DataType{NullType{}}.simple_string() == "void");
    CHECK(DataType{BooleanType{}}.simple_string() == "boolean");
    CHECK(DataType{IntegerType{8}}.simple_string() == "tinyint");
    CHECK(DataType{IntegerType{16}}.simple_string() == "smallint");
    CHECK(DataType{IntegerType{32}}.simple_string() == "int");
    CHECK(DataType{IntegerType{}}.simple_string() == "bigint");
    CHECK(DataType{FloatType{32}}.simple_string() == "float");
    CHECK(DataType{FloatType{}}.simple_string() == "double");
    CHECK(DataType{DecimalType{38, 18}}.simple_string() == "decimal(38,18)");
    CHECK(DataType{StringType{}}.simple_string() == "string");
    CHECK(DataType{BinaryType{}}.simple_string() == "binary");
    CHECK(DataType{DateType{}}.simple_string() == "date");
    CHECK(DataType{TimestampType{}}.simple_string() == "timestamp");
    CHECK(DataType{TimestampType{true}}.simple_string() == "timestamp_ntz");
    CHECK(DataType{DayTimeIntervalType{}}.simple_string() == "interval day to second");
  }

  SECTION("nested types") {
    const DataType schema = StructType{}
                                .add("a", IntegerType{})
                                .add("b", ArrayType{StringType{}})
                                .add("c", MapType{StringType{}, FloatType{}});
    CHECK(schema.simple_string() == "struct<a:bigint,b:array<string>,c:map<string,double>>");
    CHECK(schema.sql() == "STRUCT<a: BIGINT, b: ARRAY<STRING>, c: MAP<STRING, DOUBLE>>");
  }

  SECTION("ddl quoting") {
    const auto schema = StructType{}
                            .add("plain_name", IntegerType{}, false)
                            .add("with space", StringType{})
                            .add("1st", BooleanType{});
    CHECK(schema.to_ddl() == "plain_name BIGINT NOT NULL, `with space` STRING, `1st` BOOLEAN");
    CHECK(quote_identifier_if_needed("a`b") == "`a``b`");
  }
}

TEST_CASE("localtable::DataType: predicates", "[type][short]") {
  CHECK(DataType{}.is_null());
  CHECK(DataType{IntegerType{}}.is_numeric());
  CHECK(DataType{DecimalType{}}.is_numeric());
  CHECK_FALSE(DataType{StringType{}}.is_numeric());
  CHECK(DataType{DateType{}}.is_atomic());
  CHECK_FALSE(DataType{ArrayType{IntegerType{}}}.is_atomic());
  CHECK(DataType{StructType{}}.is_struct());
  CHECK(DataType{MapType{StringType{}, IntegerType{}}}.id() == TypeId::MAP);
}

TEST_CASE("localtable::StructType", "[type][short]") {
  auto schema = StructType{}.add("a", IntegerType{}).add("b", StringType{});

  SECTION("accessors") {
    CHECK(schema.size() == 2);
    CHECK(schema.names() == std::vector<std::string>{"a", "b"});
    REQUIRE(schema.find("b") != nullptr);
    CHECK(schema.find("b")->type() == DataType{StringType{}});
    CHECK(schema.find("c") == nullptr);
  }

  SECTION("rename") {
    const auto renamed = schema.rename({"x", "y"});
    CHECK(renamed.names() == std::vector<std::string>{"x", "y"});
    CHECK(renamed[1].type() == DataType{StringType{}});
    CHECK_THROWS_AS(schema.rename({"x"}), AxisLengthMismatchError);
  }

  SECTION("as_struct") {
    CHECK(as_struct(schema) == schema);
    const auto wrapped = as_struct(IntegerType{32});
    REQUIRE(wrapped.size() == 1);
    CHECK(wrapped[0].name == "value");
    CHECK(wrapped[0].type() == DataType{IntegerType{32}});
  }

  SECTION("deduplicate field names") {
    const auto deduped =
        deduplicate_field_names(StructType{}.add("a", IntegerType{}).add("b", StringType{}).add(
            "a", StructType{}.add("x", BooleanType{}).add("x", BooleanType{})));
    CHECK(deduped.names() == std::vector<std::string>{"a_0", "b", "a_1"});
    CHECK(deduped[2].type().get<StructType>().names() == std::vector<std::string>{"x_0", "x_1"});
  }

  SECTION("has_null_type") {
    CHECK_FALSE(has_null_type(schema));
    CHECK(has_null_type(StructType{}.add("a", ArrayType{NullType{}})));
    CHECK(has_null_type(DataType{MapType{StringType{}, NullType{}}}));
  }
}

TEST_CASE("localtable::merge_types", "[type][short]") {
  SECTION("null is absorbed") {
    CHECK(merge_types(NullType{}, StringType{}) == DataType{StringType{}});
    CHECK(merge_types(DateType{}, NullType{}) == DataType{DateType{}});
  }

  SECTION("numeric promotion") {
    CHECK(merge_types(IntegerType{32}, IntegerType{64}) == DataType{IntegerType{64}});
    CHECK(merge_types(FloatType{32}, FloatType{64}) == DataType{FloatType{64}});
    CHECK(merge_types(IntegerType{64}, FloatType{64}) == DataType{FloatType{64}});
    CHECK(merge_types(IntegerType{16}, FloatType{32}) == DataType{FloatType{32}});
    CHECK(merge_types(DecimalType{10, 2}, DecimalType{5, 4}) == DataType{DecimalType{12, 4}});
  }

  SECTION("decimal and floating point") {
    CHECK(merge_types(DecimalType{38, 18}, FloatType{64}) == DataType{FloatType{64}});
    CHECK(merge_types(FloatType{32}, DecimalType{10, 2}) == DataType{FloatType{64}});
  }

  SECTION("integer and decimal") {
    CHECK(merge_types(IntegerType{64}, DecimalType{38, 18}) == DataType{DecimalType{38, 18}});
    CHECK(merge_types(DecimalType{10, 2}, IntegerType{64}) == DataType{DecimalType{22, 2}});
    CHECK(merge_types(IntegerType{32}, DecimalType{5, 2}) == DataType{DecimalType{12, 2}});
    CHECK(merge_types(DecimalType{4, 1}, IntegerType{8}) == DataType{DecimalType{4, 1}});
  }

  SECTION("timestamps") {
    CHECK(merge_types(TimestampType{true}, TimestampType{false}) == DataType{TimestampType{}});
  }

  SECTION("commutativity") {
    const std::vector<DataType> types{NullType{},
                                      IntegerType{8},
                                      IntegerType{64},
                                      FloatType{32},
                                      FloatType{64},
                                      DecimalType{10, 2},
                                      DecimalType{20, 5},
                                      DecimalType{38, 18},
                                      IntegerType{32},
                                      StringType{},
                                      TimestampType{true},
                                      TimestampType{false},
                                      ArrayType{IntegerType{32}},
                                      ArrayType{FloatType{64}},
                                      MapType{StringType{}, IntegerType{8}},
                                      MapType{StringType{}, NullType{}}};
    for (const auto& a : types) {
      for (const auto& b : types) {
        DataType ab{};
        try {
          ab = merge_types(a, b);
        } catch (const TypeMergeError&) {
          CHECK_THROWS_AS(merge_types(b, a), TypeMergeError);
          continue;
        }
        CHECK(ab == merge_types(b, a));
      }
    }
  }

  SECTION("structs") {
    const auto a = StructType{}.add("x", IntegerType{32}).add("y", NullType{});
    const auto b = StructType{}.add("x", IntegerType{64}).add("y", StringType{}).add(
        "z", BooleanType{});
    const auto merged = merge_types(a, b);
    CHECK(merged.names() == std::vector<std::string>{"x", "y", "z"});
    CHECK(merged[0].type() == DataType{IntegerType{64}});
    CHECK(merged[1].type() == DataType{StringType{}});
    CHECK(merged[2].type() == DataType{BooleanType{}});
  }

  SECTION("incompatible types") {
    CHECK_THROWS_AS(merge_types(StringType{}, IntegerType{}), TypeMergeError);
    CHECK_THROWS_AS(merge_types(DecimalType{}, StringType{}), TypeMergeError);
    CHECK_THROWS_WITH(
        merge_types(StructType{}.add("a", StringType{}), StructType{}.add("a", BooleanType{})),
        Catch::Matchers::Equals(
            "[CANNOT_MERGE_TYPE] field a: Can not merge type string and boolean."));
    try {
      std::ignore = merge_types(ArrayType{StringType{}}, ArrayType{DateType{}}, "col");
      FAIL("expected TypeMergeError");
    } catch (const TypeMergeError& e) {
      CHECK(e.error_class() == "CANNOT_MERGE_TYPE");
      CHECK(e.first() == DataType{StringType{}});
      CHECK(e.second() == DataType{DateType{}});
      CHECK(e.field_path() == "element in array of col");
    }
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-function-cognitive-complexity)

}  // namespace localtable::test
