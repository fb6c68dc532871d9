// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/schema_inference.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "localtable/errors.hpp"
#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-function-cognitive-complexity)
TEST_CASE("localtable::infer_type: atomic values", "[inference][short]") {
  CHECK(infer_type(Value::null()) == DataType{NullType{}});
  CHECK(infer_type(true) == DataType{BooleanType{}});
  CHECK(infer_type(1) == DataType{IntegerType{64}});
  CHECK(infer_type(1.5) == DataType{FloatType{64}});
  CHECK(infer_type(Value::decimal("1.25")) == DataType{DecimalType{38, 18}});
  CHECK(infer_type("abc") == DataType{StringType{}});
  CHECK(infer_type(Value::binary("abc")) == DataType{BinaryType{}});
  CHECK(infer_type(Value::date(0)) == DataType{DateType{}});
  CHECK(infer_type(Value::interval(1)) == DataType{DayTimeIntervalType{}});

  SECTION("timestamps") {
    const auto naive = Value::timestamp(0, false);
    const auto aware = Value::timestamp(0, true);
    CHECK(infer_type(naive) == DataType{TimestampType{false}});
    CHECK(infer_type(aware) == DataType{TimestampType{false}});

    InferenceOptions opts{};
    opts.prefer_timestamp_ntz = true;
    CHECK(infer_type(naive, opts) == DataType{TimestampType{true}});
    CHECK(infer_type(aware, opts) == DataType{TimestampType{false}});
  }
}

TEST_CASE("localtable::infer_type: nested values", "[inference][short]") {
  SECTION("lists") {
    CHECK(infer_type(Value::list({})) == DataType{ArrayType{NullType{}}});
    CHECK(infer_type(Value::list({1, Value::null(), 2.5})) == DataType{ArrayType{FloatType{}}});
    CHECK_THROWS_AS(infer_type(Value::list({1, "a"})), TypeMergeError);

    InferenceOptions opts{};
    opts.infer_array_from_first_element = true;
    CHECK(infer_type(Value::list({Value::null(), 1, "a"}), opts) ==
          DataType{ArrayType{IntegerType{}}});
  }

  SECTION("maps") {
    const auto map = Value::map({{"b", 1}, {"a", Value::null()}, {"c", 2}});
    CHECK(infer_type(map) == DataType{MapType{StringType{}, IntegerType{}}});
    CHECK(infer_type(Value::map({})) == DataType{MapType{NullType{}, NullType{}}});

    InferenceOptions opts{};
    opts.infer_dict_as_struct = true;
    CHECK(infer_type(map, opts) ==
          DataType{StructType{}.add("b", IntegerType{}).add("c", IntegerType{})});
    CHECK_THROWS_AS(infer_type(Value::map({{1, 2}}), opts), InvalidInputTypeError);
  }

  SECTION("rows and objects") {
    CHECK(infer_type(Value::row({"y", "x"}, {1, "a"})) ==
          DataType{StructType{}.add("y", IntegerType{}).add("x", StringType{})});
    CHECK(infer_type(Value::tuple({1, "a"})) ==
          DataType{StructType{}.add("_1", IntegerType{}).add("_2", StringType{})});
    CHECK(infer_type(Value::object({{"y", 1}, {"x", "a"}})) ==
          DataType{StructType{}.add("x", StringType{}).add("y", IntegerType{})});
  }
}

TEST_CASE("localtable::infer_record_schema", "[inference][short]") {
  std::vector<std::string> names{};

  SECTION("maps are sorted by key") {
    const auto schema = infer_record_schema(Value::map({{"b", 1}, {"a", "x"}}), names);
    CHECK(schema == StructType{}.add("a", StringType{}).add("b", IntegerType{}));
    CHECK(names.empty());
  }

  SECTION("positional records extend the names") {
    names = {"name"};
    const auto schema = infer_record_schema(Value::list({"Alice", 1}), names);
    CHECK(names == std::vector<std::string>{"name", "_2"});
    CHECK(schema == StructType{}.add("name", StringType{}).add("_2", IntegerType{}));
  }

  SECTION("named rows keep their order") {
    const auto schema = infer_record_schema(Value::row({"y", "x"}, {1, 2}), names);
    CHECK(schema.names() == std::vector<std::string>{"y", "x"});
  }

  SECTION("objects are sorted by attribute") {
    const auto schema = infer_record_schema(Value::object({{"y", 1}, {"x", 2}}), names);
    CHECK(schema.names() == std::vector<std::string>{"x", "y"});
  }

  SECTION("scalars") {
    CHECK(infer_record_schema(1.5, names) == StructType{}.add("value", FloatType{}));
  }
}

TEST_CASE("localtable::infer_schema_from_records", "[inference][short]") {
  std::vector<std::string> names{};

  SECTION("empty input") {
    CHECK_THROWS_AS(infer_schema_from_records({}, names), EmptyInputError);
  }

  SECTION("map keys are sorted") {
    const auto schema = infer_schema_from_records({Value::map({{"b", 1}, {"a", 2}})}, names);
    CHECK(schema.names() == std::vector<std::string>{"a", "b"});
  }

  SECTION("scalars") {
    const auto schema = infer_schema_from_records({1, 2, 3}, names);
    CHECK(schema == StructType{}.add("value", IntegerType{}));
  }

  SECTION("types are merged across records") {
    const auto schema = infer_schema_from_records(
        {Value::tuple({1, Value::null()}), Value::tuple({2.5, "a"})}, names);
    CHECK(schema == StructType{}.add("_1", FloatType{}).add("_2", StringType{}));
    CHECK(names == std::vector<std::string>{"_1", "_2"});
  }

  SECTION("fields missing in some records") {
    const auto schema = infer_schema_from_records(
        {Value::map({{"a", 1}}), Value::map({{"a", 2}, {"b", "x"}})}, names);
    CHECK(schema == StructType{}.add("a", IntegerType{}).add("b", StringType{}));
  }

  SECTION("caller names are extended") {
    names = {"name"};
    const auto schema = infer_schema_from_records({Value::tuple({"Alice", 1, true})}, names);
    CHECK(names == std::vector<std::string>{"name", "_2", "_3"});
    CHECK(schema.names() == names);
  }

  SECTION("null-only fields stay null") {
    const auto schema =
        infer_schema_from_records({Value::tuple({"Alice", Value::null(), 80.1})}, names);
    CHECK(has_null_type(schema));
  }

  SECTION("incompatible records") {
    CHECK_THROWS_AS(infer_schema_from_records({Value::map({{"a", 1}}), Value::map({{"a", "x"}})},
                                              names),
                    TypeMergeError);
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-function-cognitive-complexity)

}  // namespace localtable::test
