// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/safe_numeric_cast.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace localtable::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-function-cognitive-complexity)
TEST_CASE("localtable::numeric_type_name", "[numeric][short]") {
  STATIC_CHECK(numeric_type_name<bool>() == "bool");
  STATIC_CHECK(numeric_type_name<std::int8_t>() == "int8");
  STATIC_CHECK(numeric_type_name<std::int64_t>() == "int64");
  STATIC_CHECK(numeric_type_name<std::uint16_t>() == "uint16");
  STATIC_CHECK(numeric_type_name<std::uint32_t>() == "uint32");
  STATIC_CHECK(numeric_type_name<float>() == "float32");
  STATIC_CHECK(numeric_type_name<double>() == "float64");
}

TEST_CASE("localtable::fits_in", "[numeric][short]") {
  using U8 = std::uint8_t;
  using U64 = std::uint64_t;
  using I8 = std::int8_t;
  using I32 = std::int32_t;
  using I64 = std::int64_t;

  SECTION("same signedness") {
    STATIC_CHECK(fits_in<I8>(I64{127}));
    STATIC_CHECK(fits_in<I8>(I64{-128}));
    STATIC_CHECK_FALSE(fits_in<I8>(I64{128}));
    STATIC_CHECK_FALSE(fits_in<I8>(I64{-129}));
    STATIC_CHECK(fits_in<I64>(I8{-1}));
    STATIC_CHECK_FALSE(fits_in<U8>(U64{256}));
  }

  SECTION("signed to unsigned") {
    STATIC_CHECK(fits_in<U8>(I32{255}));
    STATIC_CHECK_FALSE(fits_in<U8>(I32{-1}));
    STATIC_CHECK(fits_in<U64>(std::numeric_limits<I64>::max()));
  }

  SECTION("unsigned to signed") {
    STATIC_CHECK(fits_in<I8>(U8{127}));
    STATIC_CHECK_FALSE(fits_in<I8>(U8{128}));
    STATIC_CHECK_FALSE(fits_in<I64>(std::numeric_limits<U64>::max()));
  }
}

TEST_CASE("localtable::safe_numeric_cast", "[numeric][short]") {
  using U8 = std::uint8_t;
  using I8 = std::int8_t;
  using I16 = std::int16_t;
  using I32 = std::int32_t;
  using I64 = std::int64_t;

  SECTION("integer to integer") {
    CHECK(safe_numeric_cast<I32>(I64{2147483647}) == 2147483647);
    CHECK(safe_numeric_cast<I32>(I64{-2147483648}) == std::numeric_limits<I32>::lowest());
    CHECK(safe_numeric_cast<U8>(I16{255}) == 255);
    CHECK_THROWS_AS(safe_numeric_cast<I32>(I64{2147483648}), std::invalid_argument);
    CHECK_THROWS_AS(safe_numeric_cast<U8>(I8{-1}), std::invalid_argument);
    CHECK_THROWS_WITH(safe_numeric_cast<I8>(I64{1000}),
                      Catch::Matchers::Equals("1000 (int64) does not fit in int8"));
  }

  SECTION("to floating-point") {
    CHECK(safe_numeric_cast<double>(I64{3}) == 3.0);
    CHECK(safe_numeric_cast<float>(I8{-2}) == -2.0F);
    CHECK(safe_numeric_cast<float>(0.5) == 0.5F);
    CHECK(std::isnan(safe_numeric_cast<float>(std::numeric_limits<double>::quiet_NaN())));
  }

  SECTION("with field name") {
    CHECK(safe_numeric_cast<I16>("a", I64{-32768}) == -32768);
    CHECK_THROWS_WITH(safe_numeric_cast<U8>("foo", I16{256}),
                      Catch::Matchers::Equals("foo: 256 (int16) does not fit in uint8"));
    CHECK_THROWS_WITH(safe_numeric_cast<I8>("a.b", I64{-1000}),
                      Catch::Matchers::Equals("a.b: -1000 (int64) does not fit in int8"));
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-function-cognitive-complexity)

}  // namespace localtable::test
