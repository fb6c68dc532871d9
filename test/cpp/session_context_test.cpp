// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/session_context.hpp"

#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "localtable/errors.hpp"
#include "localtable/type.hpp"

namespace localtable::test {

namespace {
// Returns fewer values than requested
class BrokenSessionContext final : public SessionContext {
 public:
  [[nodiscard]] std::vector<std::optional<std::string>> get_configs(
      [[maybe_unused]] const std::vector<std::string> &keys) const override {
    return {};
  }
  [[nodiscard]] DataType parse_ddl(std::string_view ddl) const override {
    throw DdlParseError(ddl, 0, "not supported");
  }
};
}  // namespace

// NOLINTBEGIN(*-avoid-magic-numbers, readability-function-cognitive-complexity)
TEST_CASE("localtable::StaticSessionContext", "[config][short]") {
  StaticSessionContext ctx{};
  ctx.set("a", "1").set("b", "2").set("a", "3");

  const auto values = ctx.get_configs({"a", "b", "c"});
  REQUIRE(values.size() == 3);
  CHECK(values[0] == "3");
  CHECK(values[1] == "2");
  CHECK_FALSE(values[2].has_value());

  CHECK(ctx.parse_ddl("a int") == DataType{StructType{}.add("a", IntegerType{32})});
}

TEST_CASE("localtable::IngestionOptions", "[config][short]") {
  SECTION("defaults") {
    const auto opts = IngestionOptions::from_context(StaticSessionContext{});
    CHECK_FALSE(opts.infer_dict_as_struct);
    CHECK_FALSE(opts.infer_array_from_first_element);
    CHECK_FALSE(opts.prefer_timestamp_ntz);
    CHECK(opts.session_timezone == "UTC");
    CHECK_FALSE(opts.safe_array_cast);
  }

  SECTION("overrides") {
    StaticSessionContext ctx{};
    ctx.set(std::string{config::INFER_DICT_AS_STRUCT}, "true")
        .set(std::string{config::INFER_ARRAY_FROM_FIRST_ELEMENT}, "true")
        .set(std::string{config::TIMESTAMP_TYPE}, "timestamp_ntz")
        .set(std::string{config::SESSION_TIMEZONE}, "Europe/Oslo")
        .set(std::string{config::SAFE_ARRAY_CAST}, "true");

    const auto opts = IngestionOptions::from_context(ctx);
    CHECK(opts.infer_dict_as_struct);
    CHECK(opts.infer_array_from_first_element);
    CHECK(opts.prefer_timestamp_ntz);
    CHECK(opts.session_timezone == "Europe/Oslo");
    CHECK(opts.safe_array_cast);
  }

  SECTION("invalid values") {
    StaticSessionContext ctx{};
    ctx.set(std::string{config::INFER_DICT_AS_STRUCT}, "yes")
        .set(std::string{config::INFER_ARRAY_FROM_FIRST_ELEMENT}, "True")
        .set(std::string{config::TIMESTAMP_TYPE}, "TIMESTAMP_LTZ")
        .set(std::string{config::SESSION_TIMEZONE}, "")
        .set(std::string{config::SAFE_ARRAY_CAST}, "TRUE");

    const auto opts = IngestionOptions::from_context(ctx);
    CHECK_FALSE(opts.infer_dict_as_struct);
    CHECK_FALSE(opts.infer_array_from_first_element);
    CHECK_FALSE(opts.safe_array_cast);
    CHECK_FALSE(opts.prefer_timestamp_ntz);
    CHECK(opts.session_timezone == "UTC");
  }

  SECTION("misbehaving session") {
    CHECK_THROWS_AS(IngestionOptions::from_context(BrokenSessionContext{}), std::runtime_error);
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-function-cognitive-complexity)

}  // namespace localtable::test
