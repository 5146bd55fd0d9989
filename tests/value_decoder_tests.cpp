#include "widerow/decode/value_decoder.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

using namespace widerow::decode;
using Catch::Matchers::ContainsSubstring;

namespace {

ByteBuffer bytes(std::initializer_list<std::uint8_t> values)
{
    ByteBuffer out;
    for (const auto value : values) {
        out.push_back(static_cast<std::byte>(value));
    }
    return out;
}

RowData make_row(std::string_view key, std::vector<ColumnValue> columns)
{
    return RowData{to_byte_buffer(key), std::move(columns)};
}

}  // namespace

TEST_CASE("Runtime primitive decoders resolve by type tag")
{
    const auto decoder = make_primitive_value_decoder("int16");
    REQUIRE(decoder);
    CHECK(decoder->kind() == DecoderKind::Primitive);
    CHECK(decoder->arity() == 1U);
    CHECK(decoder->type_name() == "int16");
    CHECK(decoder->decode(make_row("row", {bytes({0x00, 0x2A})})) == Value{std::int16_t{42}});

    CHECK_THROWS_AS(decoder->decode(make_row("row", {std::nullopt})), NullValueError);
    CHECK_THROWS_AS(decoder->decode(make_row("row", {bytes({0x00, 0x2A}), bytes({0x00})})), ArityError);
    CHECK_THROWS_AS(decoder->decode(make_row("row", {bytes({0x2A})})), MalformedValueError);
}

TEST_CASE("Runtime optional decoders yield no value only for absent columns")
{
    const auto decoder = make_optional_value_decoder(make_primitive_value_decoder("string"));
    CHECK(decoder->kind() == DecoderKind::Optional);
    CHECK(decoder->type_name() == "optional<string>");
    CHECK(decoder->decode(make_row("row", {to_byte_buffer("hello")})) == Value{std::string{"hello"}});
    CHECK_FALSE(decoder->decode(make_row("row", {std::nullopt})).has_value());
    CHECK(decoder->decode(make_row("row", {bytes({})})) == Value{std::string{}});
}

TEST_CASE("Runtime product decoders build tuple values")
{
    std::vector<ValueDecoderPtr> components{make_primitive_value_decoder("string"),
                                            make_primitive_value_decoder("int32"),
                                            make_optional_value_decoder(make_primitive_value_decoder("boolean"))};
    const auto decoder = make_product_value_decoder(std::move(components));
    CHECK(decoder->kind() == DecoderKind::Product);
    CHECK(decoder->arity() == 3U);
    CHECK(decoder->type_name() == "(string, int32, optional<boolean>)");

    SECTION("full row")
    {
        const auto value = decoder->decode(make_row("k", {to_byte_buffer("name"), bytes({0, 0, 0, 5}), std::nullopt}));
        CHECK(value == make_tuple_value({Value{std::string{"name"}}, Value{std::int32_t{5}}, Value{}}));
    }

    SECTION("row key fallback")
    {
        const auto value = decoder->decode(make_row("k", {bytes({0, 0, 0, 5}), bytes({0x01})}));
        CHECK(value == make_tuple_value({Value{std::string{"k"}}, Value{std::int32_t{5}}, Value{true}}));
    }

    SECTION("arity mismatch")
    {
        CHECK_THROWS_AS(decoder->decode(make_row("k", {bytes({0x01})})), ArityError);
    }
}

TEST_CASE("Runtime decoder factories reject invalid compositions")
{
    SECTION("unknown primitive")
    {
        CHECK_THROWS_AS(make_primitive_value_decoder("uuid"), ConfigurationError);
        CHECK_THROWS_AS(make_primitive_value_decoder(PrimitiveDecoderEntry{}), ConfigurationError);
    }

    SECTION("optional over a non-primitive")
    {
        const auto pair = make_product_value_decoder(
            {make_primitive_value_decoder("int32"), make_primitive_value_decoder("int32")});
        try {
            static_cast<void>(make_optional_value_decoder(pair));
            FAIL("expected a configuration error");
        } catch (const ConfigurationError& error) {
            CHECK(error.code() == DecodeErrc::InvalidConfiguration);
            CHECK_THAT(error.what(), ContainsSubstring("only wrap a primitive"));
        }

        const auto nested = make_optional_value_decoder(make_primitive_value_decoder("int32"));
        CHECK_THROWS_AS(make_optional_value_decoder(nested), ConfigurationError);
        CHECK_THROWS_AS(make_optional_value_decoder(nullptr), ConfigurationError);
    }

    SECTION("product arity outside the supported range")
    {
        CHECK_THROWS_AS(make_product_value_decoder({make_primitive_value_decoder("int32")}), ConfigurationError);

        std::vector<ValueDecoderPtr> eleven(11U, make_primitive_value_decoder("boolean"));
        CHECK_THROWS_AS(make_product_value_decoder(eleven), ConfigurationError);

        std::vector<ValueDecoderPtr> ten(10U, make_primitive_value_decoder("boolean"));
        CHECK(make_product_value_decoder(ten)->arity() == 10U);
    }

    SECTION("missing component")
    {
        CHECK_THROWS_AS(make_product_value_decoder({make_primitive_value_decoder("int32"), nullptr}),
                        ConfigurationError);
    }
}
