#include "widerow/decode/column_codec.hpp"
#include "widerow/decode/decode_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <vector>

using namespace widerow::decode;

namespace {

std::vector<std::byte> bytes(std::initializer_list<std::uint8_t> values)
{
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (const auto value : values) {
        out.push_back(static_cast<std::byte>(value));
    }
    return out;
}

template <typename T>
DecodeErrc decode_failure(const std::vector<std::byte>& input)
{
    try {
        static_cast<void>(ColumnCodec<T>::decode(input));
    } catch (const DecodeError& error) {
        return static_cast<DecodeErrc>(error.code().value());
    }
    return DecodeErrc::Success;
}

}  // namespace

TEST_CASE("Integer codecs read big-endian two's complement")
{
    CHECK(ColumnCodec<std::int16_t>::decode(bytes({0x01, 0x02})) == 258);
    CHECK(ColumnCodec<std::int16_t>::decode(bytes({0xFF, 0xFE})) == -2);
    CHECK(ColumnCodec<std::int32_t>::decode(bytes({0x00, 0x00, 0x00, 0x2A})) == 42);
    CHECK(ColumnCodec<std::int32_t>::decode(bytes({0x80, 0x00, 0x00, 0x00})) ==
          std::numeric_limits<std::int32_t>::min());
    CHECK(ColumnCodec<std::int64_t>::decode(bytes({0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00})) ==
          4'294'967'296LL);
    CHECK(ColumnCodec<std::int64_t>::decode(bytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF})) == -1);
}

TEST_CASE("Fixed width codecs ignore trailing bytes")
{
    CHECK(ColumnCodec<std::int32_t>::decode(bytes({0x00, 0x00, 0x00, 0x07, 0xAA, 0xBB})) == 7);
}

TEST_CASE("Floating point codecs read IEEE 754 bit patterns")
{
    CHECK(ColumnCodec<float>::decode(bytes({0x3F, 0xC0, 0x00, 0x00})) == 1.5F);
    CHECK(ColumnCodec<double>::decode(bytes({0xC0, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00})) == -2.5);
    CHECK(std::isnan(ColumnCodec<double>::decode(bytes({0x7F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}))));
}

TEST_CASE("Boolean codec requires exactly one byte")
{
    CHECK(ColumnCodec<bool>::decode(bytes({0x00})) == false);
    CHECK(ColumnCodec<bool>::decode(bytes({0x01})) == true);
    CHECK(ColumnCodec<bool>::decode(bytes({0xFF})) == true);
    CHECK(decode_failure<bool>(bytes({})) == DecodeErrc::MalformedValue);
    CHECK(decode_failure<bool>(bytes({0x01, 0x00})) == DecodeErrc::MalformedValue);
}

TEST_CASE("String codec reads UTF-8 bytes verbatim")
{
    CHECK(ColumnCodec<std::string>::decode(bytes({0x68, 0x69})) == "hi");
    CHECK(ColumnCodec<std::string>::decode(bytes({0xC3, 0xA9})) == "\xC3\xA9");
    CHECK(ColumnCodec<std::string>::decode(bytes({})).empty());
}

TEST_CASE("Decimal codec reads scale then unscaled value")
{
    const auto value = ColumnCodec<Decimal>::decode(bytes({0x00, 0x00, 0x00, 0x02, 0x30, 0x39}));
    CHECK(value.scale() == 2);
    CHECK(value.to_string() == "123.45");

    CHECK(decode_failure<Decimal>(bytes({0x00, 0x00, 0x00, 0x02})) == DecodeErrc::MalformedValue);
}

TEST_CASE("Short fixed width values are malformed")
{
    CHECK(decode_failure<std::int16_t>(bytes({0x01})) == DecodeErrc::MalformedValue);
    CHECK(decode_failure<std::int32_t>(bytes({0x00, 0x00, 0x2A})) == DecodeErrc::MalformedValue);
    CHECK(decode_failure<std::int64_t>(bytes({0x00, 0x00, 0x00, 0x00})) == DecodeErrc::MalformedValue);
    CHECK(decode_failure<float>(bytes({})) == DecodeErrc::MalformedValue);
    CHECK(decode_failure<double>(bytes({0x3F, 0xF0, 0x00, 0x00})) == DecodeErrc::MalformedValue);
}

TEST_CASE("Column decodability trait")
{
    STATIC_CHECK(is_column_decodable_v<std::int32_t>);
    STATIC_CHECK(is_column_decodable_v<Decimal>);
    STATIC_CHECK(is_column_decodable_v<std::string>);
    STATIC_CHECK_FALSE(is_column_decodable_v<char>);
    STATIC_CHECK_FALSE(is_column_decodable_v<std::vector<int>>);
}
