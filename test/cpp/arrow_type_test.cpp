// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/arrow_type.hpp"

#include <arrow/type.h>

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

#include "localtable/errors.hpp"
#include "localtable/type.hpp"

namespace localtable::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-function-cognitive-complexity)
TEST_CASE("localtable::to_arrow_type", "[arrow][short]") {
  SECTION("atomic types") {
    CHECK(to_arrow_type(NullType{})->Equals(*arrow::null()));
    CHECK(to_arrow_type(BooleanType{})->Equals(*arrow::boolean()));
    CHECK(to_arrow_type(IntegerType{8})->Equals(*arrow::int8()));
    CHECK(to_arrow_type(IntegerType{64})->Equals(*arrow::int64()));
    CHECK(to_arrow_type(FloatType{32})->Equals(*arrow::float32()));
    CHECK(to_arrow_type(DecimalType{12, 3})->Equals(*arrow::decimal128(12, 3)));
    CHECK(to_arrow_type(StringType{})->Equals(*arrow::utf8()));
    CHECK(to_arrow_type(BinaryType{})->Equals(*arrow::binary()));
    CHECK(to_arrow_type(DateType{})->Equals(*arrow::date32()));
    CHECK(to_arrow_type(DayTimeIntervalType{})->Equals(*arrow::duration(arrow::TimeUnit::MICRO)));
  }

  SECTION("timestamps") {
    CHECK(to_arrow_type(TimestampType{false})
              ->Equals(*arrow::timestamp(arrow::TimeUnit::MICRO, "UTC")));
    CHECK(to_arrow_type(TimestampType{true})->Equals(*arrow::timestamp(arrow::TimeUnit::MICRO)));
  }

  SECTION("nested types") {
    const auto list = to_arrow_type(ArrayType{IntegerType{32}});
    REQUIRE(list->id() == arrow::Type::LIST);
    CHECK(list->field(0)->name() == "element");
    CHECK(list->field(0)->type()->Equals(*arrow::int32()));

    const auto map = to_arrow_type(MapType{StringType{}, FloatType{}, false});
    REQUIRE(map->id() == arrow::Type::MAP);
    const auto& map_type = static_cast<const arrow::MapType&>(*map);
    CHECK(map_type.key_type()->Equals(*arrow::utf8()));
    CHECK(map_type.item_type()->Equals(*arrow::float64()));
    CHECK_FALSE(map_type.item_field()->nullable());

    const auto st = to_arrow_type(StructType{}.add("a", BooleanType{}, false));
    REQUIRE(st->id() == arrow::Type::STRUCT);
    CHECK(st->field(0)->name() == "a");
    CHECK_FALSE(st->field(0)->nullable());
  }

  SECTION("invalid decimals") {
    CHECK_THROWS_AS(to_arrow_type(DecimalType{39, 0}), UnsupportedTypeForEncodingError);
    CHECK_THROWS_AS(to_arrow_type(DecimalType{0, 0}), UnsupportedTypeForEncodingError);
  }
}

TEST_CASE("localtable::to_arrow_schema", "[arrow][short]") {
  const auto schema =
      StructType{}.add("a", IntegerType{}).add("b", StringType{}).add("a", DateType{});
  const auto arrow_schema = to_arrow_schema(schema);
  CHECK(arrow_schema->field_names() == std::vector<std::string>{"a_0", "b", "a_1"});
  CHECK(arrow_schema->field(2)->type()->Equals(*arrow::date32()));
}

TEST_CASE("localtable::from_arrow_type", "[arrow][short]") {
  SECTION("unsigned integers are widened") {
    CHECK(from_arrow_type(arrow::uint8()) == DataType{IntegerType{16}});
    CHECK(from_arrow_type(arrow::uint16()) == DataType{IntegerType{32}});
    CHECK(from_arrow_type(arrow::uint32()) == DataType{IntegerType{64}});
    CHECK(from_arrow_type(arrow::uint64()) == DataType{DecimalType{20, 0}});
  }

  SECTION("equivalent encodings") {
    CHECK(from_arrow_type(arrow::large_utf8()) == DataType{StringType{}});
    CHECK(from_arrow_type(arrow::large_binary()) == DataType{BinaryType{}});
    CHECK(from_arrow_type(arrow::date64()) == DataType{DateType{}});
    CHECK(from_arrow_type(arrow::float16()) == DataType{FloatType{32}});
    CHECK(from_arrow_type(arrow::timestamp(arrow::TimeUnit::NANO)) ==
          DataType{TimestampType{true}});
    CHECK(from_arrow_type(arrow::timestamp(arrow::TimeUnit::NANO, "Europe/Oslo")) ==
          DataType{TimestampType{false}});
    CHECK(from_arrow_type(arrow::duration(arrow::TimeUnit::NANO)) ==
          DataType{DayTimeIntervalType{}});
    CHECK(from_arrow_type(arrow::dictionary(arrow::int32(), arrow::utf8())) ==
          DataType{StringType{}});
    CHECK(from_arrow_type(arrow::large_list(arrow::int64())) ==
          DataType{ArrayType{IntegerType{64}}});
  }

  SECTION("unsupported types") {
    CHECK_THROWS_AS(from_arrow_type(arrow::decimal256(40, 2)), UnsupportedTypeForEncodingError);
    CHECK_THROWS_AS(from_arrow_type(arrow::time64(arrow::TimeUnit::MICRO)),
                    UnsupportedTypeForEncodingError);
  }

  SECTION("canonical encodings round trip") {
    const std::vector<DataType> types{
        BooleanType{},
        IntegerType{16},
        FloatType{64},
        DecimalType{38, 18},
        StringType{},
        TimestampType{false},
        TimestampType{true},
        ArrayType{StringType{}},
        MapType{StringType{}, IntegerType{}},
        StructType{}.add("x", DateType{}).add("y", ArrayType{BinaryType{}, false})};
    for (const auto& t : types) {
      CAPTURE(t.simple_string());
      CHECK(from_arrow_type(to_arrow_type(t)) == t);
    }
  }
}

TEST_CASE("localtable::arrow dtype predicates", "[arrow][short]") {
  STATIC_REQUIRE(is_string_dtype(arrow::Type::LARGE_STRING));
  STATIC_REQUIRE(is_integral_dtype(arrow::Type::UINT64));
  STATIC_REQUIRE(is_unsigned_dtype(arrow::Type::UINT8));
  STATIC_REQUIRE_FALSE(is_unsigned_dtype(arrow::Type::INT8));
  STATIC_REQUIRE(is_numeric_dtype(arrow::Type::DOUBLE));
  STATIC_REQUIRE(is_temporal_dtype(arrow::Type::TIMESTAMP));
  STATIC_REQUIRE_FALSE(is_numeric_dtype(arrow::Type::STRING));
}
// NOLINTEND(*-avoid-magic-numbers, readability-function-cognitive-complexity)

}  // namespace localtable::test
