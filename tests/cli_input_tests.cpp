#include "widerow/tools/cli_input.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace widerow::decode;
using widerow::tools::is_blank_or_comment_line;
using widerow::tools::parse_column_token;
using widerow::tools::parse_hex_bytes;
using widerow::tools::parse_row_line;

TEST_CASE("Hex tokens decode to bytes")
{
    CHECK(parse_hex_bytes("0000002a") == ByteBuffer{std::byte{0x00}, std::byte{0x00}, std::byte{0x00}, std::byte{0x2A}});
    CHECK(parse_hex_bytes("0xFFfe") == ByteBuffer{std::byte{0xFF}, std::byte{0xFE}});
    CHECK(parse_hex_bytes("").empty());
    CHECK(parse_hex_bytes("0x").empty());
    CHECK_THROWS_AS(parse_hex_bytes("abc"), std::invalid_argument);
    CHECK_THROWS_AS(parse_hex_bytes("zz"), std::invalid_argument);
}

TEST_CASE("Column tokens distinguish absent, text and hex values")
{
    CHECK_FALSE(parse_column_token("-").has_value());
    CHECK_FALSE(parse_column_token("null").has_value());
    CHECK(parse_column_token("s:hello") == ColumnValue{to_byte_buffer("hello")});
    CHECK(parse_column_token("s:") == ColumnValue{ByteBuffer{}});
    CHECK(parse_column_token("0x01") == ColumnValue{ByteBuffer{std::byte{0x01}}});
    CHECK_THROWS_AS(parse_column_token("hello"), std::invalid_argument);
}

TEST_CASE("Row lines split into row key and columns")
{
    const auto row = parse_row_line("  s:user-1\t0000002a -  s:name ");
    CHECK(ByteBuffer(row.row_key().begin(), row.row_key().end()) == to_byte_buffer("user-1"));
    REQUIRE(row.column_count() == 3U);
    CHECK(row.column(0U) == ColumnValue{ByteBuffer{std::byte{0}, std::byte{0}, std::byte{0}, std::byte{0x2A}}});
    CHECK_FALSE(row.column(1U).has_value());
    CHECK(row.column(2U) == ColumnValue{to_byte_buffer("name")});

    CHECK(parse_row_line("s:only").column_count() == 0U);
    CHECK_THROWS_AS(parse_row_line("   "), std::invalid_argument);
    CHECK_THROWS_AS(parse_row_line("- 01"), std::invalid_argument);
}

TEST_CASE("Blank and comment lines are recognised after leading whitespace")
{
    CHECK(is_blank_or_comment_line(""));
    CHECK(is_blank_or_comment_line(" \t\r"));
    CHECK(is_blank_or_comment_line("# header"));
    CHECK(is_blank_or_comment_line("   # indented comment"));
    CHECK(is_blank_or_comment_line("\t#"));
    CHECK_FALSE(is_blank_or_comment_line("s:key 01"));
    CHECK_FALSE(is_blank_or_comment_line("  s:key #not-a-comment"));
}
