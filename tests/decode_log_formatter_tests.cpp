#include "widerow/tools/decode_log_formatter.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace widerow::decode;
using widerow::tools::format_decode_log_json;
using widerow::tools::format_type_listing;
using widerow::tools::format_value_json;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Decode log formatter emits every counter")
{
    DecodeTelemetrySnapshot snapshot{};
    snapshot.rows_attempted = 10U;
    snapshot.rows_decoded = 7U;
    snapshot.rows_skipped = 3U;
    snapshot.arity_errors = 1U;
    snapshot.null_value_errors = 2U;
    snapshot.total_decode_duration_ns = 5'000U;
    snapshot.last_decode_duration_ns = 120U;

    const auto json = format_decode_log_json("batch/\"main\"", snapshot);
    CHECK(json.front() == '{');
    CHECK(json.back() == '}');
    CHECK(json.find('\n') == std::string::npos);
    CHECK_THAT(json, ContainsSubstring("\"identifier\":\"batch/\\\"main\\\"\""));
    CHECK_THAT(json, ContainsSubstring("\"rows_attempted\":10"));
    CHECK_THAT(json, ContainsSubstring("\"rows_decoded\":7"));
    CHECK_THAT(json, ContainsSubstring("\"rows_skipped\":3"));
    CHECK_THAT(json, ContainsSubstring("\"arity_errors\":1"));
    CHECK_THAT(json, ContainsSubstring("\"null_value_errors\":2"));
    CHECK_THAT(json, ContainsSubstring("\"malformed_value_errors\":0"));
    CHECK_THAT(json, ContainsSubstring("\"configuration_errors\":0"));
    CHECK_THAT(json, ContainsSubstring("\"total_decode_duration_ns\":5000"));
    CHECK_THAT(json, ContainsSubstring("\"last_decode_duration_ns\":120"));
}

TEST_CASE("Decoded values render as JSON")
{
    CHECK(format_value_json(Value{}) == "null");
    CHECK(format_value_json(Value{false}) == "false");
    CHECK(format_value_json(Value{std::int64_t{-12}}) == "-12");
    CHECK(format_value_json(Value{2.5}) == "2.5");
    CHECK(format_value_json(Value{std::numeric_limits<double>::infinity()}) == "null");
    CHECK(format_value_json(Value{Decimal::from_int64(31415, 4)}) == "\"3.1415\"");
    CHECK(format_value_json(Value{std::string{"line\nbreak\x01"}}) == "\"line\\nbreak\\u0001\"");
    CHECK(format_value_json(make_tuple_value({Value{std::int32_t{1}}, Value{}, make_tuple_value({Value{true}})})) ==
          "[1,null,[true]]");
}

TEST_CASE("Type listing shows fixed and variable widths")
{
    const auto* int32 = find_primitive_decoder("int32");
    const auto* boolean = find_primitive_decoder("boolean");
    const auto* text = find_primitive_decoder("string");
    REQUIRE(int32 != nullptr);
    REQUIRE(boolean != nullptr);
    REQUIRE(text != nullptr);

    CHECK(format_type_listing(*int32) == "int32 4 bytes");
    CHECK(format_type_listing(*boolean) == "boolean 1 byte");
    CHECK(format_type_listing(*text) == "string variable");
}
