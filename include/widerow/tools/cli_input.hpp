#pragma once

#include "widerow/decode/row_data.hpp"

#include <string_view>

namespace widerow::tools {

// Hex digits with an optional 0x prefix. Throws std::invalid_argument on odd length or a non-hex digit.
[[nodiscard]] widerow::decode::ByteBuffer parse_hex_bytes(std::string_view text);

// "-" or "null" is an absent column, "s:TEXT" is UTF-8 text, anything else is hex.
[[nodiscard]] widerow::decode::ColumnValue parse_column_token(std::string_view token);

// True for a line holding only whitespace or whose first non-blank character is '#'.
[[nodiscard]] bool is_blank_or_comment_line(std::string_view line) noexcept;

// Whitespace separated tokens: the row key first, then one token per column.
[[nodiscard]] widerow::decode::RowData parse_row_line(std::string_view line);

}  // namespace widerow::tools
